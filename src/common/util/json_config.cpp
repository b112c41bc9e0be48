#include "common/util/json_config.h"
#include "common/logging.h"
#include <fstream>
#include <memory>
#include <sstream>

MCBE::JsonConfigFile::JsonConfigFile()
{
}

MCBE::JsonConfigFile::JsonConfigFile(const Json::Value &value)
{
	m_root = value;
}

MCBE::JsonConfigFile::~JsonConfigFile()
{
}

MCBE::JsonConfigFile MCBE::JsonConfigFile::Load(const std::string &filename)
{
	JsonConfigFile ret;

	std::ifstream file(filename);
	if (!file.is_open()) {
		LOG_WARN(MOD_CONFIG, "Could not open config file {}", filename);
		return ret;
	}

	Json::CharReaderBuilder builder;
	std::string errors;
	if (!Json::parseFromStream(builder, file, &ret.m_root, &errors)) {
		LOG_ERROR(MOD_CONFIG, "Failed to parse config file {}: {}", filename, errors);
		ret.m_root = Json::Value();
	}

	return ret;
}

MCBE::JsonConfigFile MCBE::JsonConfigFile::Parse(const std::string &text)
{
	JsonConfigFile ret;
	std::istringstream stream(text);

	Json::CharReaderBuilder builder;
	std::string errors;
	if (!Json::parseFromStream(builder, stream, &ret.m_root, &errors)) {
		LOG_ERROR(MOD_CONFIG, "Failed to parse config: {}", errors);
		ret.m_root = Json::Value();
	}

	return ret;
}

bool MCBE::JsonConfigFile::Save(const std::string &filename) const
{
	std::ofstream file(filename);
	if (!file.is_open()) {
		LOG_ERROR(MOD_CONFIG, "Could not open {} for writing", filename);
		return false;
	}

	Json::StreamWriterBuilder builder;
	builder["indentation"] = "\t";
	std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
	writer->write(m_root, &file);
	file << std::endl;
	return file.good();
}

std::string MCBE::JsonConfigFile::GetVariableString(const std::string &title, const std::string &parameter, const std::string &default_value) const
{
	if (!m_root.isObject() || !m_root.isMember(title)) {
		return default_value;
	}

	const auto &section = m_root[title];
	if (!section.isObject() || !section.isMember(parameter) || !section[parameter].isString()) {
		return default_value;
	}

	return section[parameter].asString();
}

int MCBE::JsonConfigFile::GetVariableInt(const std::string &title, const std::string &parameter, const int default_value) const
{
	if (!m_root.isObject() || !m_root.isMember(title)) {
		return default_value;
	}

	const auto &section = m_root[title];
	if (!section.isObject() || !section.isMember(parameter) || !section[parameter].isInt()) {
		return default_value;
	}

	return section[parameter].asInt();
}

bool MCBE::JsonConfigFile::GetVariableBool(const std::string &title, const std::string &parameter, const bool default_value) const
{
	if (!m_root.isObject() || !m_root.isMember(title)) {
		return default_value;
	}

	const auto &section = m_root[title];
	if (!section.isObject() || !section.isMember(parameter) || !section[parameter].isBool()) {
		return default_value;
	}

	return section[parameter].asBool();
}

double MCBE::JsonConfigFile::GetVariableDouble(const std::string &title, const std::string &parameter, const double default_value) const
{
	if (!m_root.isObject() || !m_root.isMember(title)) {
		return default_value;
	}

	const auto &section = m_root[title];
	if (!section.isObject() || !section.isMember(parameter) || !section[parameter].isNumeric()) {
		return default_value;
	}

	return section[parameter].asDouble();
}
