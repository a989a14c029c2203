#ifndef LOGVEC_COMMON_LOGGER_H_
#define LOGVEC_COMMON_LOGGER_H_

#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace logvec {
namespace common {

class Logger {
public:
    /**
     * @brief Install the default console logger.
     * @param use_stderr Log to stderr instead of stdout (keeps stdout free for
     *        interactive query results)
     */
    static void Init(bool use_stderr = false);
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Parse a level name ("debug", "info", "warn", "error", "off").
     * @return false if the name is unknown; level is left untouched
     */
    static bool ParseLevel(const std::string& name, spdlog::level::level_enum& level);
};

} // namespace common
} // namespace logvec

#define LOGVEC_TRACE(...) spdlog::trace(__VA_ARGS__)
#define LOGVEC_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define LOGVEC_INFO(...)  spdlog::info(__VA_ARGS__)
#define LOGVEC_WARN(...)  spdlog::warn(__VA_ARGS__)
#define LOGVEC_ERROR(...) spdlog::error(__VA_ARGS__)
#define LOGVEC_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // LOGVEC_COMMON_LOGGER_H_
