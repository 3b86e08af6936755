#pragma once

#include <map>
#include <string>
#include <vector>

namespace ShapeKit {
	/**
	 * @brief INI style key/value store with [sections].
	 *
	 * Keys that appear before the first section header belong to the
	 * "global" section.
	 */
	class Config {
	public:
		Config(const std::string& filename);

		bool Load();
		bool Save() const;

		std::string GetString(const std::string& section, const std::string& key, const std::string& default_value) const;
		int         GetInt(const std::string& section, const std::string& key, int default_value) const;
		float       GetFloat(const std::string& section, const std::string& key, float default_value) const;
		double      GetDouble(const std::string& section, const std::string& key, double default_value) const;
		bool        GetBool(const std::string& section, const std::string& key, bool default_value) const;

		bool HasKey(const std::string& section, const std::string& key) const;

		void SetString(const std::string& section, const std::string& key, const std::string& value);
		void SetInt(const std::string& section, const std::string& key, int value);
		void SetFloat(const std::string& section, const std::string& key, float value);
		void SetDouble(const std::string& section, const std::string& key, double value);
		void SetBool(const std::string& section, const std::string& key, bool value);

		std::vector<std::string>           GetSections() const;
		std::map<std::string, std::string> GetSection(const std::string& section) const;

		const std::string& GetFilename() const { return m_filename; }

	private:
		std::string                                        m_filename;
		std::vector<std::string>                           m_order;
		std::map<std::string, std::map<std::string, std::string>> m_data;

		std::map<std::string, std::string>& Section(const std::string& section);
	};
} // namespace ShapeKit
