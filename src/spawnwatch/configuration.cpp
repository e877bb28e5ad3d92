// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the tracker runtime. `ConfigurationLoader` transforms raw environment
// variables into the strongly-typed `Configuration` structure consumed by
// downstream modules.
//
// Responsibilities
// - Enforce defaults for tuning knobs such as speed limit, scan horizon and
//   retry ceilings; unparseable numbers fall back with a warning.
// - Treat region, account and fleet problems as fatal (`ConfigurationError`).
// - Shield the rest of the codebase from `std::getenv` lookups.
//
// Accounts come from SPAWNWATCH_ACCOUNTS, SPAWNWATCH_ACCOUNTS_CSV, or both;
// duplicates are rejected later by AccountManager.

#include "spawnwatch/configuration.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <optional>

#include <fmt/format.h>

#include "spawnwatch/logging.hpp"

namespace spawnwatch {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_data_directory{"data"};
constexpr std::string_view k_default_region{"32.7400,-117.1750,32.7550,-117.1570"};
constexpr int k_default_fleet_size{4};
constexpr double k_default_speed_limit_mps{8.5};             /**< Roughly 19 mph. */
constexpr double k_default_scan_horizon_s{60.0};
constexpr double k_default_visit_timeout_s{10.0};
constexpr int k_default_transient_retry_ceiling{3};
constexpr int k_default_protocol_retry_ceiling{2};
constexpr double k_default_scheduler_interval_s{1.0};
constexpr double k_default_suppression_radius_m{70.0};
constexpr double k_default_challenge_timeout_s{300.0};
constexpr double k_default_rate_limit_cooldown_s{60.0};
constexpr double k_default_monitor_interval_s{30.0};
constexpr int k_default_sim_spawn_count{200};
constexpr double k_default_sim_failure_rate{0.02};

std::string trim(std::string_view raw_value) {
    const auto first = raw_value.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = raw_value.find_last_not_of(" \t\r\n");
    return std::string{raw_value.substr(first, last - first + 1)};
}

std::vector<std::string> split(std::string_view raw_value, char delimiter) {
    std::vector<std::string> list_parts;
    std::size_t start = 0;
    while (start <= raw_value.size()) {
        const auto end = raw_value.find(delimiter, start);
        if (end == std::string_view::npos) {
            list_parts.push_back(trim(raw_value.substr(start)));
            break;
        }
        list_parts.push_back(trim(raw_value.substr(start, end - start)));
        start = end + 1;
    }
    return list_parts;
}

const char* env(const char* name) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return nullptr;
    }
    return raw_value;
}

double parse_double(const char* name, double fallback) {
    const char* raw_value = env(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        return parsed_value <= 0.0 ? fallback : parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {}={} as a number; using fallback {}", name, raw_value, fallback);
        return fallback;
    }
}

double parse_fraction(const char* name, double fallback) {
    const char* raw_value = env(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (parsed_value < 0.0 || parsed_value > 1.0) {
            get_logger()->warn("{}={} is outside [0, 1]; using fallback {}", name, raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {}={} as a fraction; using fallback {}", name, raw_value, fallback);
        return fallback;
    }
}

int parse_int(const char* name, int fallback) {
    const char* raw_value = env(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        return parsed_value <= 0 ? fallback : parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {}={} as an integer; using fallback {}", name, raw_value, fallback);
        return fallback;
    }
}

/** @brief Like parse_int but keeps an explicit zero (used where 0 disables a check). */
int parse_count(const char* name, int fallback) {
    const char* raw_value = env(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        return parsed_value < 0 ? fallback : parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {}={} as a count; using fallback {}", name, raw_value, fallback);
        return fallback;
    }
}

/** @brief Fleet size is fatal when explicitly zero, so it bypasses the positive clamp. */
std::size_t parse_fleet_size() {
    const char* raw_value = env("SPAWNWATCH_FLEET_SIZE");
    if (raw_value == nullptr) {
        return static_cast<std::size_t>(k_default_fleet_size);
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        if (parsed_value < 0) {
            throw ConfigurationError(std::string{"SPAWNWATCH_FLEET_SIZE cannot be negative: "} + raw_value);
        }
        return static_cast<std::size_t>(parsed_value);
    } catch (const std::logic_error&) {
        get_logger()->warn("Failed to parse SPAWNWATCH_FLEET_SIZE={}; using fallback {}", raw_value, k_default_fleet_size);
        return static_cast<std::size_t>(k_default_fleet_size);
    }
}

std::string parse_string(const char* name, std::string_view fallback) {
    const char* raw_value = env(name);
    return raw_value == nullptr ? std::string{fallback} : std::string{raw_value};
}

}  // namespace

ConfigurationError::ConfigurationError(const std::string& message)
    : std::runtime_error(message) {}

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("SPAWNWATCH_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = parse_string("SPAWNWATCH_LOG_LEVEL", "");
    config.data_directory = parse_string("SPAWNWATCH_DATA_DIR", k_default_data_directory);
    config.region = parse_region_bounds(parse_string("SPAWNWATCH_REGION", k_default_region));

    if (const char* raw_accounts = env("SPAWNWATCH_ACCOUNTS")) {
        config.accounts = parse_accounts(raw_accounts);
    }
    if (const char* raw_csv = env("SPAWNWATCH_ACCOUNTS_CSV")) {
        std::vector<AccountCredential> list_csv_accounts = load_accounts_csv(raw_csv);
        config.accounts.insert(config.accounts.end(), list_csv_accounts.begin(), list_csv_accounts.end());
    }

    config.pool.fleet_size = parse_fleet_size();
    config.pool.speed_limit_mps = parse_double("SPAWNWATCH_SPEED_LIMIT_MPS", k_default_speed_limit_mps);

    config.scheduler.region = config.region;
    config.scheduler.scan_horizon = Duration{parse_double("SPAWNWATCH_SCAN_HORIZON_S", k_default_scan_horizon_s)};
    config.scheduler.suppression_radius_m = parse_double("SPAWNWATCH_SUPPRESSION_RADIUS_M", k_default_suppression_radius_m);
    config.scheduler.max_pending_challenges = static_cast<std::size_t>(parse_count("SPAWNWATCH_MAX_PENDING_CHALLENGES", 0));
    config.scheduler_interval = Duration{parse_double("SPAWNWATCH_SCHEDULER_INTERVAL_S", k_default_scheduler_interval_s)};

    config.executor.visit_timeout = Duration{parse_double("SPAWNWATCH_VISIT_TIMEOUT_S", k_default_visit_timeout_s)};
    config.executor.login_timeout = config.executor.visit_timeout;
    // One client call in flight per worker slot.
    config.executor.call_threads = std::max<std::size_t>(config.pool.fleet_size, 1);

    config.recovery.transient_retry_ceiling = static_cast<std::size_t>(parse_int("SPAWNWATCH_TRANSIENT_RETRY_CEILING", k_default_transient_retry_ceiling));
    config.recovery.protocol_retry_ceiling = static_cast<std::size_t>(parse_int("SPAWNWATCH_PROTOCOL_RETRY_CEILING", k_default_protocol_retry_ceiling));
    config.recovery.challenge_timeout = Duration{parse_double("SPAWNWATCH_CHALLENGE_TIMEOUT_S", k_default_challenge_timeout_s)};
    config.recovery.rate_limit_cooldown = Duration{parse_double("SPAWNWATCH_RATE_LIMIT_COOLDOWN_S", k_default_rate_limit_cooldown_s)};
    config.recovery.short_cooldown = std::min(config.recovery.short_cooldown, config.recovery.rate_limit_cooldown);

    config.monitor_interval = Duration{k_default_monitor_interval_s};
    config.simulation.spawn_count = static_cast<std::size_t>(parse_int("SPAWNWATCH_SIM_SPAWN_COUNT", k_default_sim_spawn_count));
    config.simulation.failure_rate = parse_fraction("SPAWNWATCH_SIM_FAILURE_RATE", k_default_sim_failure_rate);

    validate(config);

    logger->info("Configuration loaded: accounts={} fleet_size={} speed_limit_mps={} region=({}, {}) - ({}, {})",
                 config.accounts.size(),
                 config.pool.fleet_size,
                 config.pool.speed_limit_mps,
                 config.region.south_deg,
                 config.region.west_deg,
                 config.region.north_deg,
                 config.region.east_deg);
    return config;
}

RegionBounds ConfigurationLoader::parse_region_bounds(std::string_view raw_region) {
    const std::vector<std::string> list_parts = split(raw_region, ',');
    if (list_parts.size() != 4) {
        throw ConfigurationError("Region must be four comma-separated degrees: " + std::string{raw_region});
    }
    double values[4]{};
    for (std::size_t index = 0; index < list_parts.size(); ++index) {
        try {
            std::size_t consumed = 0;
            values[index] = std::stod(list_parts[index], &consumed);
            if (consumed != list_parts[index].size()) {
                throw std::invalid_argument(list_parts[index]);
            }
        } catch (const std::logic_error&) {
            throw ConfigurationError("Region coordinate is not a number: " + list_parts[index]);
        }
    }
    RegionBounds region{
        std::min(values[0], values[2]),
        std::min(values[1], values[3]),
        std::max(values[0], values[2]),
        std::max(values[1], values[3])
    };
    if (!region.is_valid()) {
        throw ConfigurationError("Region bounds are empty or out of range: " + std::string{raw_region});
    }
    return region;
}

std::vector<AccountCredential> ConfigurationLoader::parse_accounts(std::string_view raw_accounts) {
    std::vector<AccountCredential> list_accounts;
    for (const std::string& entry : split(raw_accounts, ';')) {
        if (entry.empty()) {
            continue;
        }
        const std::vector<std::string> list_fields = split(entry, ':');
        if (list_fields.size() < 2 || list_fields.size() > 3 || list_fields[0].empty() || list_fields[1].empty()) {
            throw ConfigurationError("Account entries must look like user:pass[:provider], got " + entry);
        }
        AccountCredential credential{};
        credential.username = list_fields[0];
        credential.password = list_fields[1];
        if (list_fields.size() == 3 && !list_fields[2].empty()) {
            credential.provider = list_fields[2];
        }
        list_accounts.push_back(std::move(credential));
    }
    return list_accounts;
}

std::vector<AccountCredential> ConfigurationLoader::load_accounts_csv(const std::filesystem::path& csv_path) {
    std::ifstream stream_csv(csv_path);
    if (!stream_csv) {
        throw ConfigurationError("Unable to open accounts CSV at " + csv_path.string());
    }

    std::string line;
    if (!std::getline(stream_csv, line)) {
        throw ConfigurationError("Accounts CSV is empty: " + csv_path.string());
    }
    const std::vector<std::string> list_header = split(line, ',');
    const auto column_of = [&list_header](std::string_view name) -> std::optional<std::size_t> {
        const auto iterator_column = std::find(list_header.begin(), list_header.end(), name);
        if (iterator_column == list_header.end()) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(iterator_column - list_header.begin());
    };
    const std::optional<std::size_t> username_column = column_of("username");
    const std::optional<std::size_t> password_column = column_of("password");
    const std::optional<std::size_t> provider_column = column_of("provider");
    if (!username_column.has_value() || !password_column.has_value()) {
        throw ConfigurationError("Accounts CSV needs username and password columns: " + csv_path.string());
    }

    std::vector<AccountCredential> list_accounts;
    std::size_t line_number = 1;
    while (std::getline(stream_csv, line)) {
        ++line_number;
        if (trim(line).empty()) {
            continue;
        }
        const std::vector<std::string> list_fields = split(line, ',');
        if (list_fields.size() <= std::max(*username_column, *password_column)) {
            throw ConfigurationError(fmt::format("Accounts CSV line {} is missing fields", line_number));
        }
        AccountCredential credential{};
        credential.username = list_fields[*username_column];
        credential.password = list_fields[*password_column];
        if (provider_column.has_value() && *provider_column < list_fields.size() && !list_fields[*provider_column].empty()) {
            credential.provider = list_fields[*provider_column];
        }
        if (credential.username.empty()) {
            throw ConfigurationError(fmt::format("Accounts CSV line {} has an empty username", line_number));
        }
        list_accounts.push_back(std::move(credential));
    }
    return list_accounts;
}

void ConfigurationLoader::validate(const Configuration& configuration) {
    if (configuration.accounts.empty()) {
        throw ConfigurationError("No accounts configured; set SPAWNWATCH_ACCOUNTS or SPAWNWATCH_ACCOUNTS_CSV");
    }
    if (!configuration.region.is_valid()) {
        throw ConfigurationError("Region bounds are invalid");
    }
    if (configuration.pool.fleet_size == 0) {
        throw ConfigurationError("Fleet size must be at least one");
    }
}

}  // namespace spawnwatch
