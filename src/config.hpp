#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace config_env {

inline bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

inline std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return std::string();
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

inline std::string getString(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    if (!value || strlen(value) == 0) {
        return default_value;
    }
    return trim(value);
}

inline int getInt(const char* name, int default_value) {
    const char* value = std::getenv(name);
    if (!value || strlen(value) == 0) {
        return default_value;
    }
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(value, &end, 10);
    if (end == value || *end != '\0' || errno == ERANGE) {
        return default_value;
    }
    if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
        return default_value;
    }
    return static_cast<int>(parsed);
}

inline double getDouble(const char* name, double default_value) {
    const char* value = std::getenv(name);
    if (!value || strlen(value) == 0) {
        return default_value;
    }
    char* end = nullptr;
    double parsed = std::strtod(value, &end);
    if (end == value || *end != '\0') {
        return default_value;
    }
    return parsed;
}

inline bool getBool(const char* name, bool default_value) {
    const char* value = std::getenv(name);
    if (!value || strlen(value) == 0) {
        return default_value;
    }
    std::string lower = trim(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "true" || lower == "1" || lower == "yes";
}

inline std::chrono::milliseconds getMillis(const char* name, std::chrono::milliseconds default_value) {
    return std::chrono::milliseconds(getInt(name, static_cast<int>(default_value.count())));
}

} // namespace config_env

// Connection settings shared by every delivery path
struct ClientConfig {
    std::string server_url;
    std::string node;
    std::string api_key;
    std::string secret;
    std::chrono::milliseconds timeout{30000};
    std::string compression = "none";  // "none" or "gzip"

    void validate() const {
        if (isBlankOrEmpty(server_url)) {
            throw std::invalid_argument("Server URL cannot be empty");
        }
        if (isBlankOrEmpty(node)) {
            throw std::invalid_argument("Node cannot be empty");
        }
        if (node.size() > 255) {
            throw std::invalid_argument("Node cannot exceed 255 characters");
        }
        if (isBlankOrEmpty(api_key)) {
            throw std::invalid_argument("API key cannot be empty");
        }
        if (isBlankOrEmpty(secret)) {
            throw std::invalid_argument("Secret cannot be empty");
        }
        if (api_key.compare(0, 3, "lf_") != 0) {
            throw std::invalid_argument("API key must start with 'lf_'");
        }
        if (server_url.compare(0, 7, "http://") != 0 && server_url.compare(0, 8, "https://") != 0) {
            throw std::invalid_argument("Server URL must start with 'http://' or 'https://'");
        }
        if (timeout.count() <= 0) {
            throw std::invalid_argument("Timeout must be positive");
        }
        if (compression != "none" && compression != "gzip") {
            throw std::invalid_argument("Compression must be 'none' or 'gzip'");
        }
    }

    static ClientConfig fromEnv(const std::string& node, const std::string& secret) {
        ClientConfig config;

        const char* server_url = std::getenv("LOGFLUX_SERVER_URL");
        if (!server_url || config_env::isBlank(server_url)) {
            throw std::runtime_error("LOGFLUX_SERVER_URL environment variable is required");
        }
        config.server_url = config_env::trim(server_url);

        const char* api_key = std::getenv("LOGFLUX_API_KEY");
        if (!api_key || config_env::isBlank(api_key)) {
            throw std::runtime_error("LOGFLUX_API_KEY environment variable is required");
        }
        config.api_key = config_env::trim(api_key);

        config.node = node;
        config.secret = secret;
        config.timeout = config_env::getMillis("LOGFLUX_HTTP_TIMEOUT_MS", config.timeout);
        config.compression = config_env::getString("LOGFLUX_COMPRESSION", config.compression);

        config.validate();
        return config;
    }

private:
    static bool isBlankOrEmpty(const std::string& s) {
        return s.empty() || config_env::isBlank(s);
    }
};

// Exponential backoff parameters, shared read-only by all workers
struct RetryConfig {
    int max_retries = 5;
    std::chrono::milliseconds initial_delay{100};
    std::chrono::milliseconds max_delay{30000};
    double backoff_factor = 2.0;
    bool jitter_enabled = true;

    void validate() const {
        if (max_retries < 0) {
            throw std::invalid_argument("Max retries cannot be negative");
        }
        if (initial_delay.count() < 0) {
            throw std::invalid_argument("Initial delay cannot be negative");
        }
        if (max_delay.count() < 0) {
            throw std::invalid_argument("Max delay cannot be negative");
        }
        if (backoff_factor < 1.0) {
            throw std::invalid_argument("Backoff factor must be >= 1.0");
        }
    }
};

struct ResilientClientConfig {
    ClientConfig client;
    RetryConfig retry;
    int queue_size = 1000;
    int worker_count = 2;
    bool failsafe_mode = true;
    std::chrono::milliseconds flush_interval{5000};  // 0 disables the periodic nudge

    // Strict mode only: how long sendLog waits for queue space. 0 waits until
    // space frees up or the client shuts down.
    std::chrono::milliseconds offer_timeout{0};

    std::chrono::milliseconds shutdown_flush_timeout{10000};
    std::chrono::milliseconds worker_grace_period{5000};
    std::chrono::milliseconds poll_interval{1000};

    void validate() const {
        client.validate();
        retry.validate();
        if (queue_size <= 0) {
            throw std::invalid_argument("Queue size must be positive");
        }
        if (worker_count <= 0) {
            throw std::invalid_argument("Worker count must be positive");
        }
        if (flush_interval.count() < 0) {
            throw std::invalid_argument("Flush interval cannot be negative");
        }
        if (offer_timeout.count() < 0) {
            throw std::invalid_argument("Offer timeout cannot be negative");
        }
        if (shutdown_flush_timeout.count() < 0 || worker_grace_period.count() < 0) {
            throw std::invalid_argument("Shutdown timeouts cannot be negative");
        }
        if (poll_interval.count() <= 0) {
            throw std::invalid_argument("Poll interval must be positive");
        }
    }

    static ResilientClientConfig fromEnv(const std::string& node, const std::string& secret) {
        ResilientClientConfig config;
        config.client = ClientConfig::fromEnv(node, secret);

        config.queue_size = config_env::getInt("LOGFLUX_QUEUE_SIZE", config.queue_size);
        config.flush_interval = config_env::getMillis("LOGFLUX_FLUSH_INTERVAL_MS", config.flush_interval);
        config.worker_count = config_env::getInt("LOGFLUX_WORKER_COUNT", config.worker_count);
        config.failsafe_mode = config_env::getBool("LOGFLUX_FAILSAFE_MODE", config.failsafe_mode);

        config.retry.max_retries = config_env::getInt("LOGFLUX_MAX_RETRIES", config.retry.max_retries);
        config.retry.initial_delay = config_env::getMillis("LOGFLUX_INITIAL_DELAY_MS", config.retry.initial_delay);
        config.retry.max_delay = config_env::getMillis("LOGFLUX_MAX_DELAY_MS", config.retry.max_delay);
        config.retry.backoff_factor = config_env::getDouble("LOGFLUX_BACKOFF_FACTOR", config.retry.backoff_factor);
        config.retry.jitter_enabled = config_env::getBool("LOGFLUX_JITTER_ENABLED", config.retry.jitter_enabled);

        config.validate();
        return config;
    }
};

#endif // CONFIG_HPP
