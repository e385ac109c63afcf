// EN: Thread-safe NDJSON logger shared by the builder and every build step.
// FR: Logger NDJSON thread-safe partagé par le builder et toutes les étapes de build.

#pragma once

#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace PSB {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    NOTICE = 2,
    WARN = 3,
    ERROR = 4
};

// EN: Console verbosity presets exposed by the command line.
// FR: Préréglages de verbosité console exposés par la ligne de commande.
enum class Verbosity {
    QUIET = -1,
    NORMAL = 0,
    VERBOSE = 1,
    DEBUG = 2
};

// EN: Thread-safe logger with NDJSON output, correlation IDs and entry listeners.
// FR: Logger thread-safe avec sortie NDJSON, IDs de corrélation et écouteurs d'entrées.
class Logger {
public:
    // EN: Structure representing a log entry.
    // FR: Structure représentant une entrée de log.
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::string correlation_id;
        std::string module;
        std::string thread_id;
        std::unordered_map<std::string, std::string> metadata;
    };

    using Listener = std::function<void(const LogEntry&)>;

    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // EN: Process-wide instance used by the LOG_* macros.
    // FR: Instance globale utilisée par les macros LOG_*.
    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    // EN: Map a verbosity preset to a minimum level.
    // FR: Associe un préréglage de verbosité à un niveau minimum.
    void setVerbosity(Verbosity verbosity);

    // EN: Set output file for logging (disables console output).
    // FR: Définit le fichier de sortie (désactive la sortie console).
    void setOutputFile(const std::string& filename);

    void setConsoleOutput(bool enabled);

    void setCorrelationId(const std::string& correlation_id);
    void addGlobalMetadata(const std::string& key, const std::string& value);

    // EN: Register a listener notified with every entry that passes the level filter.
    // FR: Enregistre un écouteur notifié pour chaque entrée passant le filtre de niveau.
    void addListener(Listener listener);
    void clearListeners();

    void log(LogLevel level, const std::string& module, const std::string& message);
    void log(LogLevel level, const std::string& module, const std::string& message,
             const std::unordered_map<std::string, std::string>& metadata);

    void debug(const std::string& module, const std::string& message);
    void info(const std::string& module, const std::string& message);
    void notice(const std::string& module, const std::string& message);
    void warn(const std::string& module, const std::string& message);
    void error(const std::string& module, const std::string& message);

    void debug(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);
    void info(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void notice(const std::string& module, const std::string& message,
                const std::unordered_map<std::string, std::string>& metadata);
    void warn(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void error(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);

    void flush();

    // EN: Generate a new correlation ID (UUID-like format).
    // FR: Génère un nouvel ID de corrélation (format UUID).
    std::string generateCorrelationId();

    // EN: Format an entry as a single NDJSON line.
    // FR: Formate une entrée en une ligne NDJSON.
    static std::string formatAsNDJSON(const LogEntry& entry);

    static std::string levelToString(LogLevel level);

private:
    void writeEntry(const LogEntry& entry);
    static std::string timestampToISO8601(const std::chrono::system_clock::time_point& tp);
    static std::string getThreadId();

    LogLevel current_level_ = LogLevel::INFO;
    std::string correlation_id_;
    std::unordered_map<std::string, std::string> global_metadata_;
    std::unique_ptr<std::ofstream> log_file_;
    std::vector<Listener> listeners_;
    mutable std::mutex mutex_;
    bool console_output_ = true;
};

#define LOG_DEBUG(module, message) PSB::Logger::getInstance().debug(module, message)
#define LOG_INFO(module, message) PSB::Logger::getInstance().info(module, message)
#define LOG_NOTICE(module, message) PSB::Logger::getInstance().notice(module, message)
#define LOG_WARN(module, message) PSB::Logger::getInstance().warn(module, message)
#define LOG_ERROR(module, message) PSB::Logger::getInstance().error(module, message)

#define LOG_INFO_META(module, message, metadata) PSB::Logger::getInstance().info(module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) PSB::Logger::getInstance().error(module, message, metadata)

} // namespace PSB
