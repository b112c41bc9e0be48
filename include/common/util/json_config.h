#pragma once

#include <json/json.h>
#include <string>

namespace MCBE
{
	class JsonConfigFile
	{
	public:
		JsonConfigFile();
		JsonConfigFile(const Json::Value &value);
		~JsonConfigFile();

		// Returns an empty (null) config when the file is missing or unparsable
		static JsonConfigFile Load(const std::string &filename);
		static JsonConfigFile Parse(const std::string &text);
		bool Save(const std::string &filename) const;

		std::string GetVariableString(const std::string &title, const std::string &parameter, const std::string &default_value) const;
		int GetVariableInt(const std::string &title, const std::string &parameter, const int default_value) const;
		bool GetVariableBool(const std::string &title, const std::string &parameter, const bool default_value) const;
		double GetVariableDouble(const std::string &title, const std::string &parameter, const double default_value) const;

		Json::Value& RawHandle() { return m_root; }
		const Json::Value& RawHandle() const { return m_root; }
	private:
		Json::Value m_root;
	};
}
