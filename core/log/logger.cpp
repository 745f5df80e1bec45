/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(rampart::log, Error, e) {
  using E = rampart::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
  }
  return "Unknown log::Error";
}

namespace rampart::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem> loggingSystem() {
      auto logging_system = logging_system_.lock();
      BOOST_ASSERT_MSG(
          logging_system,
          "Logging system is not ready. "
          "rampart::log::setLoggingSystem() must be executed once before");
      return logging_system;
    }

    struct LevelOverride {
      std::string group;
      Level level;
    };

    outcome::result<LevelOverride> parseOverride(std::string_view chunk) {
      auto eq = chunk.find('=');
      if (eq == std::string_view::npos) {
        OUTCOME_TRY(level, str2lvl(chunk));
        return LevelOverride{defaultGroupName, level};
      }
      auto group = chunk.substr(0, eq);
      if (group.empty()) {
        return Error::WRONG_GROUP;
      }
      OUTCOME_TRY(level, str2lvl(chunk.substr(eq + 1)));
      return LevelOverride{std::string{group}, level};
    }
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    if (str == "trace") {
      return Level::TRACE;
    }
    if (str == "debug") {
      return Level::DEBUG;
    }
    if (str == "verbose") {
      return Level::VERBOSE;
    }
    if (str == "info" or str == "inf") {
      return Level::INFO;
    }
    if (str == "warning" or str == "warn") {
      return Level::WARN;
    }
    if (str == "error" or str == "err") {
      return Level::ERROR;
    }
    if (str == "critical" or str == "crit") {
      return Level::CRITICAL;
    }
    if (str == "off" or str == "no") {
      return Level::OFF;
    }
    return Error::WRONG_LEVEL;
  }

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
  }

  outcome::result<void> tuneLoggingSystem(
      const std::vector<std::string> &cfg) {
    auto logging_system = loggingSystem();
    for (auto &chunk : cfg) {
      OUTCOME_TRY(level_override, parseOverride(chunk));
      if (not logging_system->setLevelOfGroup(level_override.group,
                                              level_override.level)) {
        return Error::WRONG_GROUP;
      }
    }
    return outcome::success();
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return std::static_pointer_cast<soralog::LoggerFactory>(loggingSystem())
        ->getLogger(tag, group);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    return loggingSystem()->setLevelOfGroup(group_name, level);
  }

}  // namespace rampart::log
