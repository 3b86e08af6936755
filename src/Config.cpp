#include "Config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "errors.h"

namespace ShapeKit {
	namespace {
		std::string Trim(const std::string& s) {
			const char* ws = " \t\r\n";
			size_t      begin = s.find_first_not_of(ws);
			if (begin == std::string::npos)
				return "";
			size_t end = s.find_last_not_of(ws);
			return s.substr(begin, end - begin + 1);
		}
	} // namespace

	Config::Config(const std::string& filename): m_filename(filename) {}

	bool Config::Load() {
		std::ifstream file(m_filename);
		if (!file.is_open()) {
			return false;
		}

		std::string section = "global";
		std::string line;
		while (std::getline(file, line)) {
			line = Trim(line);
			if (line.empty() || line[0] == '#' || line[0] == ';') {
				continue;
			}
			if (line.front() == '[' && line.back() == ']') {
				section = Trim(line.substr(1, line.size() - 2));
				Section(section);
				continue;
			}

			std::stringstream ss(line);
			std::string       key;
			std::string       value;
			if (std::getline(ss, key, '=') && std::getline(ss, value)) {
				Section(section)[Trim(key)] = Trim(value);
			}
		}
		return true;
	}

	bool Config::Save() const {
		std::ofstream file(m_filename);
		if (!file.is_open()) {
			return false;
		}

		for (const auto& name : m_order) {
			file << "[" << name << "]" << std::endl;
			for (const auto& pair : m_data.at(name)) {
				file << pair.first << "=" << pair.second << std::endl;
			}
			file << std::endl;
		}
		return true;
	}

	std::map<std::string, std::string>& Config::Section(const std::string& section) {
		auto it = m_data.find(section);
		if (it == m_data.end()) {
			m_order.push_back(section);
			it = m_data.emplace(section, std::map<std::string, std::string>{}).first;
		}
		return it->second;
	}

	bool Config::HasKey(const std::string& section, const std::string& key) const {
		auto sec = m_data.find(section);
		return sec != m_data.end() && sec->second.count(key) > 0;
	}

	std::string
	Config::GetString(const std::string& section, const std::string& key, const std::string& default_value) const {
		auto sec = m_data.find(section);
		if (sec != m_data.end()) {
			auto it = sec->second.find(key);
			if (it != sec->second.end()) {
				return it->second;
			}
		}
		return default_value;
	}

	int Config::GetInt(const std::string& section, const std::string& key, int default_value) const {
		if (!HasKey(section, key))
			return default_value;
		try {
			return std::stoi(GetString(section, key, ""));
		} catch (const std::logic_error&) {
			throw ConfigurationError("option '" + key + "' in [" + section + "] is not an integer");
		}
	}

	float Config::GetFloat(const std::string& section, const std::string& key, float default_value) const {
		return static_cast<float>(GetDouble(section, key, default_value));
	}

	double Config::GetDouble(const std::string& section, const std::string& key, double default_value) const {
		if (!HasKey(section, key))
			return default_value;
		try {
			return std::stod(GetString(section, key, ""));
		} catch (const std::logic_error&) {
			throw ConfigurationError("option '" + key + "' in [" + section + "] is not a number");
		}
	}

	bool Config::GetBool(const std::string& section, const std::string& key, bool default_value) const {
		if (!HasKey(section, key))
			return default_value;
		std::string value = GetString(section, key, "");
		std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
		return value == "true" || value == "1" || value == "yes" || value == "on";
	}

	void Config::SetString(const std::string& section, const std::string& key, const std::string& value) {
		Section(section)[key] = value;
	}

	void Config::SetInt(const std::string& section, const std::string& key, int value) {
		Section(section)[key] = std::to_string(value);
	}

	void Config::SetFloat(const std::string& section, const std::string& key, float value) {
		Section(section)[key] = std::to_string(value);
	}

	void Config::SetDouble(const std::string& section, const std::string& key, double value) {
		std::ostringstream ss;
		ss.precision(17);
		ss << value;
		Section(section)[key] = ss.str();
	}

	void Config::SetBool(const std::string& section, const std::string& key, bool value) {
		Section(section)[key] = value ? "true" : "false";
	}

	std::vector<std::string> Config::GetSections() const {
		return m_order;
	}

	std::map<std::string, std::string> Config::GetSection(const std::string& section) const {
		auto it = m_data.find(section);
		if (it != m_data.end()) {
			return it->second;
		}
		return {};
	}
} // namespace ShapeKit
