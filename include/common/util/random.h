#pragma once

#include <random>
#include <utility>
#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace MCBE {
	// Random source owned by whoever needs one (Dialer, tests). Seed it explicitly to get
	// reproducible client data.
	class Random {
	public:
		// [low, high]
		int Int(int low, int high)
		{
			if (low > high)
				std::swap(low, high);
			return int_dist(m_gen, int_param_t(low, high));
		}

		int64_t Int64()
		{
			return int64_dist(m_gen);
		}

		uint8_t Byte()
		{
			return static_cast<uint8_t>(Int(0, 255));
		}

		// RFC 4122 version 4 UUID, lower case
		std::string Uuid()
		{
			uint8_t b[16];
			for (auto &v : b) {
				v = Byte();
			}
			b[6] = (b[6] & 0x0f) | 0x40;
			b[8] = (b[8] & 0x3f) | 0x80;

			return fmt::format("{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
				b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
				b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
		}

		void Reseed()
		{
			std::random_device rd;
			m_gen.seed(rd());
		}

		void Reseed(uint64_t seed)
		{
			m_gen.seed(seed);
		}

		Random()
		{
			Reseed();
		}

		explicit Random(uint64_t seed)
		{
			Reseed(seed);
		}

	private:
		typedef std::uniform_int_distribution<int>::param_type int_param_t;
		std::uniform_int_distribution<int> int_dist;
		std::uniform_int_distribution<int64_t> int64_dist;
		std::mt19937_64 m_gen;
	};
}
