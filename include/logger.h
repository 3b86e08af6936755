#pragma once

#include <concepts>
#include <cstdint>
#include <iostream>
#if __has_include(<source_location>)
	#include <source_location>
#endif
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
using namespace std::literals; // required for ""sv

namespace logger {
#if defined(__cpp_lib_source_location)
	using source_location_type = std::source_location;
#else
	struct source_location_type {
		static constexpr source_location_type current() noexcept { return {}; }

		constexpr const char* file_name() const noexcept { return "unknown"; }

		constexpr uint32_t line() const noexcept { return 0; }
	};
#endif

	enum class LogLevel : uint8_t { LOG, INFO, WARNING, ERROR, DEBUG };

	constexpr std::string_view levelString(const LogLevel& level) {
		switch (level) {
		case LogLevel::LOG:
			return "LOG"sv;
		case LogLevel::INFO:
			return "INFO"sv;
		case LogLevel::WARNING:
			return "WARNING"sv;
		case LogLevel::ERROR:
			return "ERROR"sv;
		case LogLevel::DEBUG:
			return "DEBUG"sv;
		}
		return "LOG"sv;
	}

	struct LogMessage {
		const LogLevel         level = LogLevel::LOG;
		const std::string      message;   // Message with placeholders filled in
		const std::string_view file_name; // View of the const char*
		const std::string      tags;
		const unsigned int     line_number;
	};

	inline const std::string format(const LogMessage& msg) {
		std::stringstream str;
		str << "[" << levelString(msg.level) << "] " << msg.message;
		if (!msg.tags.empty()) {
			str << " " << msg.tags;
		}
		str << " (" << msg.file_name << ":" << msg.line_number << ")";
		return str.str();
	}

	/**
	 * @brief Replace each "{}" in the pattern with the next argument.
	 *
	 * consumed receives the number of arguments used; the rest are rendered
	 * as tags by the caller.
	 */
	inline std::string interpolate(std::string_view pattern, const std::vector<std::string>& args, size_t& consumed) {
		std::string out;
		out.reserve(pattern.size());
		consumed = 0;
		size_t pos = 0;
		while (pos < pattern.size()) {
			size_t open = pattern.find("{}", pos);
			if (open == std::string_view::npos || consumed >= args.size()) {
				out.append(pattern.substr(pos));
				break;
			}
			out.append(pattern.substr(pos, open - pos));
			out.append(args[consumed++]);
			pos = open + 2;
		}
		return out;
	}

	template <typename T>
	std::string stringify(const T& value) {
		std::stringstream ss;
		ss << value;
		return ss.str();
	}

	class Backend { // abstract base class for backend
	public:
		virtual ~Backend() = default;
		virtual bool render(const std::string_view& str) = 0;
	};

	class ConsoleBackend: public Backend {
	public:
		bool render(const std::string_view& str) override {
			std::clog << str << std::endl;
			return true;
		}
	};

	struct LogSource {
		std::string_view     msg;
		source_location_type loc;

		template <typename StringType>
		constexpr LogSource(const StringType& m, const source_location_type& l = source_location_type::current()):
			msg(m), loc(l) {}
	};

	template <class B>
		requires std::derived_from<B, Backend>
	class Logger {
		B        backend;
		LogLevel threshold = LogLevel::DEBUG;

		static constexpr int rank(LogLevel level) {
			switch (level) {
			case LogLevel::ERROR:
				return 0;
			case LogLevel::WARNING:
				return 1;
			case LogLevel::LOG:
			case LogLevel::INFO:
				return 2;
			case LogLevel::DEBUG:
				return 3;
			}
			return 2;
		}

		template <typename... Ts>
		void doLogging(const LogLevel& level, const LogSource& src, Ts&&... flags) {
			if (rank(level) > rank(threshold))
				return;

			std::vector<std::string> args{stringify(flags)...};
			size_t                   consumed = 0;
			std::string              message = interpolate(src.msg, args, consumed);

			std::stringstream tags;
			for (size_t i = consumed; i < args.size(); ++i) {
				tags << "[" << args[i] << "] ";
			}
			LogMessage log{
				.level = level,
				.message = message,
				.file_name = src.loc.file_name(),
				.tags = tags.str(),
				.line_number = src.loc.line(),
			};

			std::string logStr = format(log);
			backend.render(logStr);
		}

	public:
		void setThreshold(LogLevel level) { threshold = level; }

		B& getBackend() { return backend; }

		template <typename... Ts>
		void LOG(LogSource& src, Ts&&... flags) {
			doLogging(LogLevel::LOG, src, std::forward<Ts>(flags)...);
		};

		template <typename... Ts>
		void INFO(LogSource& src, Ts&&... flags) {
			doLogging(LogLevel::INFO, src, std::forward<Ts>(flags)...);
		};

		template <typename... Ts>
		void WARNING(LogSource& src, Ts&&... flags) {
			doLogging(LogLevel::WARNING, src, std::forward<Ts>(flags)...);
		};

		template <typename... Ts>
		void ERROR(LogSource& src, Ts&&... flags) {
			doLogging(LogLevel::ERROR, src, std::forward<Ts>(flags)...);
		};

		template <typename... Ts>
		void DEBUG(LogSource& src, Ts&&... flags) {
			doLogging(LogLevel::DEBUG, src, std::forward<Ts>(flags)...);
		};
	};

	inline Logger<ConsoleBackend> defaultLogger;

	inline void setThreshold(LogLevel level) {
		defaultLogger.setThreshold(level);
	}

	template <typename... Ts>
	void LOG(LogSource src, Ts&&... flags) {
		defaultLogger.LOG(src, std::forward<Ts>(flags)...);
	};

	template <typename... Ts>
	void ERROR(LogSource src, Ts&&... flags) {
		defaultLogger.ERROR(src, std::forward<Ts>(flags)...);
	};

	template <typename... Ts>
	void DEBUG(LogSource src, Ts&&... flags) {
		defaultLogger.DEBUG(src, std::forward<Ts>(flags)...);
	};

	template <typename... Ts>
	void INFO(LogSource src, Ts&&... flags) {
		defaultLogger.INFO(src, std::forward<Ts>(flags)...);
	};

	template <typename... Ts>
	void WARNING(LogSource src, Ts&&... flags) {
		defaultLogger.WARNING(src, std::forward<Ts>(flags)...);
	};

}; // namespace logger
