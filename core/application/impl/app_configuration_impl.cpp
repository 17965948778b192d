/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <set>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>

namespace {
  using nineteen::application::NodeRole;

  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  template <typename T>
  std::optional<T> find_argument(boost::program_options::variables_map &vm,
                                 const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return it->second.as<T>();
      }
    }
    return std::nullopt;
  }

  std::optional<uint16_t> parsePort(std::string_view str) {
    uint32_t port = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), port);
    if (ec != std::errc{} or ptr != str.data() + str.size() or port == 0
        or port > std::numeric_limits<uint16_t>::max()) {
      return std::nullopt;
    }
    return static_cast<uint16_t>(port);
  }

  template <typename T>
  std::optional<T> parseNumber(std::string_view str) {
    T value{};
    auto [ptr, ec] =
        std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} or ptr != str.data() + str.size()) {
      return std::nullopt;
    }
    return value;
  }

  std::optional<std::string> processEnvironment(const char *name) {
    if (auto value = std::getenv(name); value != nullptr) {
      return std::string{value};
    }
    return std::nullopt;
  }

  std::vector<nineteen::primitives::TaskType> defaultTaskTypes() {
    using nineteen::primitives::TaskType;
    return {
        TaskType{.name = "chat-llama-3-2-3b",
                 .volume_to_requests = 1.,
                 .capacity_per_participant = 120.,
                 .timeout = std::chrono::seconds(30)},
        TaskType{.name = "proteus-text-to-image",
                 .volume_to_requests = 10.,
                 .capacity_per_participant = 600.,
                 .timeout = std::chrono::seconds(60)},
    };
  }

  constexpr std::array kRoles{
      std::pair{NodeRole::Migrate, std::string_view{"migrate"}},
      std::pair{NodeRole::EntryNode, std::string_view{"entry-node"}},
      std::pair{NodeRole::QueryNode, std::string_view{"query-node"}},
      std::pair{NodeRole::ControlNode, std::string_view{"control-node"}},
      std::pair{NodeRole::ChainNode, std::string_view{"chain-node"}},
  };
}  // namespace

namespace nineteen::application {

  std::string_view toString(NodeRole role) {
    for (auto &[value, name] : kRoles) {
      if (value == role) {
        return name;
      }
    }
    return "unknown";
  }

  std::optional<NodeRole> nodeRoleFromString(std::string_view str) {
    for (auto &[value, name] : kRoles) {
      if (name == str) {
        return value;
      }
    }
    return std::nullopt;
  }

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : AppConfigurationImpl(std::move(logger), &processEnvironment) {}

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger,
                                             Environment environment)
      : weightsInterval_{std::chrono::minutes(10)},
        gatewayThreads_{16},
        logger_{std::move(logger)},
        get_env_{std::move(environment)},
        task_types_{defaultTaskTypes()} {}

  AppConfigurationImpl::FilePtr AppConfigurationImpl::open_file(
      const std::string &filepath) {
    return AppConfigurationImpl::FilePtr(std::fopen(filepath.c_str(), "r"),
                                         &std::fclose);
  }

  bool AppConfigurationImpl::load_str(const rapidjson::Value &val,
                                      const char *name,
                                      std::string &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsString()) {
      target.assign(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_bool(const rapidjson::Value &val,
                                       const char *name,
                                       bool &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsBool()) {
      target = m->value.GetBool();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u16(const rapidjson::Value &val,
                                      const char *name,
                                      uint16_t &target) {
    uint32_t i;
    if (load_u32(val, name, i)
        && (i & ~std::numeric_limits<uint16_t>::max()) == 0) {
      target = static_cast<uint16_t>(i);
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u32(const rapidjson::Value &val,
                                      const char *name,
                                      uint32_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint()) {
      target = m->value.GetUint();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_i64(const rapidjson::Value &val,
                                      const char *name,
                                      int64_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsInt64()) {
      target = m->value.GetInt64();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_double(const rapidjson::Value &val,
                                         const char *name,
                                         double &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsNumber()) {
      target = m->value.GetDouble();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_ms(const rapidjson::Value &val,
                                     const char *name,
                                     std::chrono::milliseconds &target) {
    int64_t ms = 0;
    if (load_i64(val, name, ms)) {
      target = std::chrono::milliseconds{ms};
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_strings(const rapidjson::Value &val,
                                          const char *name,
                                          std::vector<std::string> &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m or not m->value.IsArray()) {
      return false;
    }
    for (auto &item : m->value.GetArray()) {
      if (item.IsString()) {
        target.emplace_back(item.GetString(), item.GetStringLength());
      }
    }
    return not target.empty();
  }

  void AppConfigurationImpl::parse_general_segment(
      const rapidjson::Value &val) {
    load_str(val, "env", environment_);
    load_strings(val, "log", logger_tuning_config_);
    std::string logcfg;
    if (load_str(val, "logcfg", logcfg)) {
      logging_config_path_ = std::move(logcfg);
    }
    load_str(val, "prometheus-host", openmetrics_http_host_);
    uint16_t port = 0;
    if (load_u16(val, "prometheus-port", port)) {
      openmetrics_http_port_ = port;
    }
  }

  void AppConfigurationImpl::parse_storage_segment(
      const rapidjson::Value &val) {
    load_str(val, "host", postgres_.host);
    load_u16(val, "port", postgres_.port);
    load_str(val, "user", postgres_.user);
    load_str(val, "password", postgres_.password);
    load_str(val, "database", postgres_.database);
    load_ms(val, "statement-timeout-ms", postgres_.statement_timeout);
    uint32_t idle = 0;
    if (load_u32(val, "max-idle-connections", idle)) {
      postgres_.max_idle_connections = idle;
    }
  }

  void AppConfigurationImpl::parse_cache_segment(const rapidjson::Value &val) {
    load_str(val, "host", redis_.host);
    load_u16(val, "port", redis_.port);
    load_str(val, "password", redis_.password);
    load_u32(val, "database", redis_.database);
    load_ms(val, "timeout-ms", redis_.timeout);
    uint32_t idle = 0;
    if (load_u32(val, "max-idle-connections", idle)) {
      redis_.max_idle_connections = idle;
    }
  }

  void AppConfigurationImpl::parse_chain_segment(const rapidjson::Value &val) {
    load_str(val, "endpoint", chain_.endpoint);
    load_u16(val, "netuid", chain_.netuid);
    load_ms(val, "timeout-ms", chain_.timeout);
    load_ms(val, "sync-interval-ms", sync_.interval);
    load_ms(val, "sync-lock-ttl-ms", sync_.lock_ttl);
    load_double(val, "max-worker-stake", sync_.max_worker_stake);
  }

  void AppConfigurationImpl::parse_dispatch_segment(
      const rapidjson::Value &val) {
    uint32_t value = 0;
    if (load_u32(val, "workers", value)) {
      router_.workers = value;
    }
    if (load_u32(val, "queue-capacity", value)) {
      queue_.capacity = value;
    }
    load_u32(val, "max-attempts", router_.max_attempts);
    load_ms(val, "lease-ttl-ms", router_.lease_ttl);
    load_ms(val, "request-timeout-ms", router_.request_timeout);
    load_ms(val, "backoff-base-ms", router_.backoff.base);
    load_ms(val, "backoff-max-ms", router_.backoff.max);
    load_ms(val, "idle-requeue-delay-ms", router_.idle_requeue_delay);
    load_ms(val, "recovery-interval-ms", router_.recovery_interval);
    load_ms(val,
            "participant-refresh-interval-ms",
            router_.participant_refresh_interval);
  }

  void AppConfigurationImpl::parse_scoring_segment(
      const rapidjson::Value &val) {
    load_ms(val, "window-ms", scoring_.window);
    load_ms(val, "half-life-ms", scoring_.half_life);
    load_double(val, "prior-weight", scoring_.prior_weight);
    load_double(val, "baseline", scoring_.baseline);
    load_ms(val, "epoch-length-ms", epoch_.length);
    int64_t origin = 0;
    if (load_i64(val, "epoch-origin-ms", origin)) {
      epoch_.origin = clock::fromMillis(origin);
    }
    load_ms(val, "weights-interval-ms", weightsInterval_);
    load_u32(val, "weights-max-attempts", weight_setter_.max_attempts);
    load_ms(val, "weights-backoff-base-ms", weight_setter_.backoff.base);
    load_ms(val, "weights-backoff-max-ms", weight_setter_.backoff.max);
  }

  void AppConfigurationImpl::parse_gateway_segment(
      const rapidjson::Value &val) {
    load_str(val, "host", gateway_host_);
    std::string port;
    uint16_t numeric_port = 0;
    if (load_str(val, "port", port)) {
      set_gateway_port(port);
    } else if (load_u16(val, "port", numeric_port)) {
      set_gateway_port(std::to_string(numeric_port));
    }
    std::vector<std::string> keys;
    if (load_strings(val, "api-keys", keys)) {
      gateway_.api_keys = {keys.begin(), keys.end()};
    }
    load_i64(val, "rate-limit-per-minute", gateway_.rate_limit_per_minute);
    load_ms(val, "min-timeout-ms", gateway_.min_timeout);
    load_ms(val, "max-timeout-ms", gateway_.max_timeout);
    uint32_t threads = 0;
    if (load_u32(val, "threads", threads)) {
      gatewayThreads_ = threads;
    }
  }

  void AppConfigurationImpl::parse_synthetic_segment(
      const rapidjson::Value &val) {
    load_bool(val, "enabled", synthetic_.enabled);
    load_ms(val, "scoring-period-ms", synthetic_.scoring_period);
    load_double(val,
                "scoring-period-multiplier",
                synthetic_.scoring_period_multiplier);
  }

  bool AppConfigurationImpl::parse_tasks_segment(const rapidjson::Value &val) {
    if (not val.IsArray()) {
      SL_ERROR(logger_, "Segment 'tasks' must be an array");
      return false;
    }
    std::vector<primitives::TaskType> task_types;
    for (auto &item : val.GetArray()) {
      if (not item.IsObject()) {
        SL_ERROR(logger_, "Task type must be an object");
        return false;
      }
      primitives::TaskType type;
      if (not load_str(item, "name", type.name)) {
        SL_ERROR(logger_, "Task type without a name");
        return false;
      }
      load_double(item, "volume-to-requests", type.volume_to_requests);
      load_double(item, "capacity", type.capacity_per_participant);
      load_ms(item, "timeout-ms", type.timeout);
      load_bool(item, "enabled", type.enabled);
      task_types.emplace_back(std::move(type));
    }
    task_types_ = std::move(task_types);
    return true;
  }

  bool AppConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with -c option",
               filepath);
      return false;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer_size{};
    FileReadStream input_stream(
        file.get(), buffer_size.data(), buffer_size.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError() or not document.IsObject()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               filepath,
               GetParseError_En(document.GetParseError()));
      return false;
    }

    using Handler = void (AppConfigurationImpl::*)(const rapidjson::Value &);
    const std::array<std::pair<const char *, Handler>, 8> handlers{{
        {"general", &AppConfigurationImpl::parse_general_segment},
        {"storage", &AppConfigurationImpl::parse_storage_segment},
        {"cache", &AppConfigurationImpl::parse_cache_segment},
        {"chain", &AppConfigurationImpl::parse_chain_segment},
        {"dispatch", &AppConfigurationImpl::parse_dispatch_segment},
        {"scoring", &AppConfigurationImpl::parse_scoring_segment},
        {"gateway", &AppConfigurationImpl::parse_gateway_segment},
        {"synthetic", &AppConfigurationImpl::parse_synthetic_segment},
    }};
    for (auto &[segment_name, handler] : handlers) {
      auto it = document.FindMember(segment_name);
      if (document.MemberEnd() != it and it->value.IsObject()) {
        (this->*handler)(it->value);
      }
    }
    if (auto it = document.FindMember("tasks"); it != document.MemberEnd()) {
      return parse_tasks_segment(it->value);
    }
    return true;
  }

  bool AppConfigurationImpl::read_environment() {
    auto env = [&](const char *name, auto &&f) {
      if (auto value = get_env_(name); value) {
        return f(*value);
      }
      return true;
    };
    auto port = [&](const char *name, uint16_t &target) {
      return env(name, [&](const std::string &value) {
        if (auto parsed = parsePort(value); parsed) {
          target = *parsed;
          return true;
        }
        SL_ERROR(logger_, "{}={} is not a valid port", name, value);
        return false;
      });
    };
    auto str = [&](const char *name, std::string &target) {
      return env(name, [&](const std::string &value) {
        target = value;
        return true;
      });
    };

    bool ok = true;
    ok = str("ENV", environment_) and ok;
    ok = str("POSTGRES_HOST", postgres_.host) and ok;
    ok = port("POSTGRES_PORT", postgres_.port) and ok;
    ok = str("POSTGRES_USER", postgres_.user) and ok;
    ok = str("POSTGRES_PASSWORD", postgres_.password) and ok;
    ok = str("POSTGRES_DB", postgres_.database) and ok;
    ok = str("REDIS_HOST", redis_.host) and ok;
    ok = port("REDIS_PORT", redis_.port) and ok;
    ok = str("REDIS_PASSWORD", redis_.password) and ok;
    ok = str("CHAIN_ENDPOINT", chain_.endpoint) and ok;
    ok = env("NETUID",
             [&](const std::string &value) {
               if (auto netuid = parseNumber<uint16_t>(value); netuid) {
                 chain_.netuid = *netuid;
                 return true;
               }
               SL_ERROR(logger_, "NETUID={} is not a valid netuid", value);
               return false;
             })
     and ok;
    ok = env("ORGANIC_SERVER_PORT",
             [&](const std::string &value) {
               set_gateway_port(value);
               return true;
             })
     and ok;
    ok = env("GATEWAY_API_KEYS",
             [&](const std::string &value) {
               std::vector<std::string> keys;
               boost::split(keys, value, boost::is_any_of(","));
               gateway_.api_keys.clear();
               for (auto &key : keys) {
                 boost::trim(key);
                 if (not key.empty()) {
                   gateway_.api_keys.emplace(std::move(key));
                 }
               }
               return true;
             })
     and ok;
    return ok;
  }

  void AppConfigurationImpl::set_gateway_port(std::string_view value) {
    gateway_port_ = parsePort(value);
    if (not gateway_port_ and value != "none") {
      SL_WARN(logger_, "Gateway port '{}' is invalid, gateway is off", value);
    }
  }

  bool AppConfigurationImpl::validate_config() {
    bool ok = true;
    auto require = [&](bool condition, std::string_view what) {
      if (not condition) {
        SL_ERROR(logger_, "Invalid configuration: {}", what);
        ok = false;
      }
    };

    require(router_.workers > 0, "dispatch workers must be positive");
    require(router_.max_attempts > 0, "max attempts must be positive");
    require(queue_.capacity > 0, "queue capacity must be positive");
    require(router_.lease_ttl.count() > 0, "lease ttl must be positive");
    require(router_.request_timeout.count() > 0,
            "request timeout must be positive");
    require(router_.backoff.base.count() > 0
                and router_.backoff.base <= router_.backoff.max,
            "dispatch backoff must satisfy 0 < base <= max");
    require(router_.lease_ttl > router_.request_timeout + router_.backoff.max,
            "lease ttl must exceed request timeout plus maximal backoff");
    require(scoring_.half_life.count() > 0, "half life must be positive");
    require(scoring_.window.count() > 0, "scoring window must be positive");
    require(scoring_.prior_weight >= 0., "prior weight must not be negative");
    require(scoring_.baseline >= 0. and scoring_.baseline <= 1.,
            "baseline must be within [0, 1]");
    require(epoch_.length.count() > 0, "epoch length must be positive");
    require(weightsInterval_.count() > 0, "weights interval must be positive");
    require(weight_setter_.max_attempts > 0,
            "weight submission attempts must be positive");
    require(sync_.interval.count() > 0, "sync interval must be positive");
    require(synthetic_.scoring_period.count() > 0
                and synthetic_.scoring_period_multiplier > 0.,
            "synthetic scoring period must be positive");
    require(gateway_.min_timeout <= gateway_.max_timeout,
            "gateway timeout bounds are inverted");
    require(gatewayThreads_ > 0, "gateway threads must be positive");

    std::set<std::string> names;
    for (auto &type : task_types_) {
      require(not type.name.empty()
                  and type.name.find('/') == std::string::npos,
              "task type names must be non-empty path segments");
      require(names.insert(type.name).second, "task type names must be unique");
      require(type.volume_to_requests > 0.,
              "volume to requests conversion must be positive");
      require(type.capacity_per_participant >= 0.,
              "capacity must not be negative");
      require(type.timeout.count() > 0, "task timeout must be positive");
    }
    return ok;
  }

  std::optional<boost::asio::ip::tcp::endpoint>
  AppConfigurationImpl::gatewayEndpoint() const {
    if (not gateway_port_) {
      return std::nullopt;
    }
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(gateway_host_, ec);
    if (ec) {
      SL_ERROR(logger_, "Gateway address '{}' is invalid", gateway_host_);
      return std::nullopt;
    }
    return boost::asio::ip::tcp::endpoint{address, *gateway_port_};
  }

  std::optional<boost::asio::ip::tcp::endpoint>
  AppConfigurationImpl::openmetricsHttpEndpoint() const {
    if (not openmetrics_http_port_) {
      return std::nullopt;
    }
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(openmetrics_http_host_, ec);
    if (ec) {
      SL_ERROR(logger_,
               "Prometheus address '{}' is invalid",
               openmetrics_http_host_);
      return std::nullopt;
    }
    return boost::asio::ip::tcp::endpoint{address, *openmetrics_http_port_};
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    std::string roles_list;
    for (auto &[role, name] : kRoles) {
      roles_list += roles_list.empty() ? "" : ", ";
      roles_list += name;
    }

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -lstorage=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "YAML logging configuration replacing the embedded one")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from.")
        ("env", po::value<std::string>(), "deployment name (ENV)")
        ("prometheus-host", po::value<std::string>(), "address for OpenMetrics over HTTP")
        ("prometheus-port", po::value<uint16_t>(), "port for OpenMetrics over HTTP, off unless given")
        ;

    po::options_description storage_desc("Storage options");
    storage_desc.add_options()
        ("postgres-host", po::value<std::string>(), "Postgres host (POSTGRES_HOST)")
        ("postgres-port", po::value<uint16_t>(), "Postgres port (POSTGRES_PORT)")
        ("postgres-user", po::value<std::string>(), "Postgres user (POSTGRES_USER)")
        ("postgres-password", po::value<std::string>(), "Postgres password (POSTGRES_PASSWORD)")
        ("postgres-db", po::value<std::string>(), "Postgres database (POSTGRES_DB)")
        ("redis-host", po::value<std::string>(), "Redis host (REDIS_HOST)")
        ("redis-port", po::value<uint16_t>(), "Redis port (REDIS_PORT)")
        ("redis-password", po::value<std::string>(), "Redis password (REDIS_PASSWORD)")
        ;

    po::options_description chain_desc("Chain options");
    chain_desc.add_options()
        ("chain-endpoint", po::value<std::string>(), "JSON-RPC endpoint of the chain proxy (CHAIN_ENDPOINT)")
        ("netuid", po::value<uint16_t>(), "subnet id (NETUID)")
        ("sync-interval-sec", po::value<uint32_t>(), "period of participant sync")
        ("max-worker-stake", po::value<double>(), "participants with more stake are not dispatched to")
        ;

    po::options_description dispatch_desc("Dispatch options");
    dispatch_desc.add_options()
        ("dispatch-workers", po::value<uint32_t>(), "number of tasks in flight")
        ("queue-capacity", po::value<uint32_t>(), "max number of queued tasks")
        ("request-timeout-ms", po::value<uint32_t>(), "limit of a single worker request")
        ("max-attempts", po::value<uint32_t>(), "dispatch attempts per task")
        ;

    po::options_description scoring_desc("Scoring options");
    scoring_desc.add_options()
        ("weights-interval-sec", po::value<uint32_t>(), "period of score computation and weight submission")
        ("epoch-length-sec", po::value<uint32_t>(), "length of a weight epoch")
        ("synthetic", po::value<bool>(), "produce synthetic traffic [true/false]")
        ("scoring-period-multiplier", po::value<double>(), "scales the synthetic scoring period")
        ;

    po::options_description gateway_desc("Gateway options");
    gateway_desc.add_options()
        ("gateway-host", po::value<std::string>(), "address the gateway listens on")
        ("gateway-port", po::value<std::string>(), "gateway port or `none` (ORGANIC_SERVER_PORT)")
        ("api-keys", po::value<std::vector<std::string>>()->multitoken(), "accepted api keys (GATEWAY_API_KEYS)")
        ("rate-limit", po::value<int64_t>(), "requests per api key and minute, 0 for no limit")
        ;
    // clang-format on

    desc.add(storage_desc)
        .add(chain_desc)
        .add(dispatch_desc)
        .add(scoring_desc)
        .add(gateway_desc);

    std::optional<std::string> role_name;
    if (argc > 1 and argv[1][0] != '-') {
      role_name = argv[1];
      argc--;
      argv++;
    }

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0 or not role_name) {
      std::cout << "Usage: nineteen <" << roles_list << "> [options]\n";
      std::cout << desc << std::endl;
      return false;
    }

    if (auto role = nodeRoleFromString(*role_name); role) {
      role_ = *role;
    } else {
      std::cerr << "Unknown subcommand '" << *role_name
                << "', expected one of: " << roles_list << std::endl;
      return false;
    }

    if (auto path = find_argument<std::string>(vm, "config-file"); path) {
      if (not read_config_from_file(*path)) {
        return false;
      }
    }

    if (not read_environment()) {
      return false;
    }

    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) {
          logger_tuning_config_ = val;
        });
    find_argument<std::string>(vm, "logcfg", [&](const std::string &val) {
      logging_config_path_ = val;
    });
    find_argument<std::string>(
        vm, "env", [&](const std::string &val) { environment_ = val; });
    find_argument<std::string>(vm,
                               "prometheus-host",
                               [&](const std::string &val) {
                                 openmetrics_http_host_ = val;
                               });
    find_argument<uint16_t>(vm, "prometheus-port", [&](uint16_t val) {
      openmetrics_http_port_ = val;
    });

    find_argument<std::string>(
        vm, "postgres-host", [&](const std::string &val) {
          postgres_.host = val;
        });
    find_argument<uint16_t>(
        vm, "postgres-port", [&](uint16_t val) { postgres_.port = val; });
    find_argument<std::string>(
        vm, "postgres-user", [&](const std::string &val) {
          postgres_.user = val;
        });
    find_argument<std::string>(
        vm, "postgres-password", [&](const std::string &val) {
          postgres_.password = val;
        });
    find_argument<std::string>(
        vm, "postgres-db", [&](const std::string &val) {
          postgres_.database = val;
        });
    find_argument<std::string>(
        vm, "redis-host", [&](const std::string &val) { redis_.host = val; });
    find_argument<uint16_t>(
        vm, "redis-port", [&](uint16_t val) { redis_.port = val; });
    find_argument<std::string>(
        vm, "redis-password", [&](const std::string &val) {
          redis_.password = val;
        });

    find_argument<std::string>(
        vm, "chain-endpoint", [&](const std::string &val) {
          chain_.endpoint = val;
        });
    find_argument<uint16_t>(
        vm, "netuid", [&](uint16_t val) { chain_.netuid = val; });
    find_argument<uint32_t>(vm, "sync-interval-sec", [&](uint32_t val) {
      sync_.interval = std::chrono::seconds(val);
    });
    find_argument<double>(vm, "max-worker-stake", [&](double val) {
      sync_.max_worker_stake = val;
    });

    find_argument<uint32_t>(
        vm, "dispatch-workers", [&](uint32_t val) { router_.workers = val; });
    find_argument<uint32_t>(
        vm, "queue-capacity", [&](uint32_t val) { queue_.capacity = val; });
    find_argument<uint32_t>(vm, "request-timeout-ms", [&](uint32_t val) {
      router_.request_timeout = std::chrono::milliseconds(val);
    });
    find_argument<uint32_t>(
        vm, "max-attempts", [&](uint32_t val) { router_.max_attempts = val; });

    find_argument<uint32_t>(vm, "weights-interval-sec", [&](uint32_t val) {
      weightsInterval_ = std::chrono::seconds(val);
    });
    find_argument<uint32_t>(vm, "epoch-length-sec", [&](uint32_t val) {
      epoch_.length = std::chrono::seconds(val);
    });
    find_argument<bool>(
        vm, "synthetic", [&](bool val) { synthetic_.enabled = val; });
    find_argument<double>(vm, "scoring-period-multiplier", [&](double val) {
      synthetic_.scoring_period_multiplier = val;
    });

    find_argument<std::string>(
        vm, "gateway-host", [&](const std::string &val) {
          gateway_host_ = val;
        });
    find_argument<std::string>(
        vm, "gateway-port", [&](const std::string &val) {
          set_gateway_port(val);
        });
    find_argument<std::vector<std::string>>(
        vm, "api-keys", [&](const std::vector<std::string> &val) {
          gateway_.api_keys = {val.begin(), val.end()};
        });
    find_argument<int64_t>(vm, "rate-limit", [&](int64_t val) {
      gateway_.rate_limit_per_minute = val;
    });

    if (not validate_config()) {
      return false;
    }

    SL_INFO(logger_,
            "Configured {} for netuid {} in environment {}",
            toString(role_),
            chain_.netuid,
            environment_);
    return true;
  }

}  // namespace nineteen::application
