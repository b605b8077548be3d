/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "main/teller_conf_loader.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/core.h>
#include <fmt/format.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/rapidjson.h>
#include <boost/optional.hpp>
#include <boost/range/adaptor/map.hpp>
#include <boost/throw_exception.hpp>
#include "common/files.hpp"
#include "common/result.hpp"
#include "common_objects/amount.hpp"
#include "common_objects/types.hpp"
#include "logger/logger.hpp"
#include "main/teller_conf_literals.hpp"
#include "validators/field_validator.hpp"

/// The length of the string around the error place to print in case of JSON
/// syntax error.
static constexpr size_t kBadJsonPrintLength = 15;

/// The offset of printed chunk towards file start from the error position.
static constexpr size_t kBadJsonPrintOffsset = 5;

static_assert(kBadJsonPrintOffsset <= kBadJsonPrintLength,
              "The place of error is out of the printed string boundaries!");

static const char *kDefaultSeedBalance = "0.00";

using ConstJsonValRef = std::reference_wrapper<rapidjson::Value const>;

class ConfigParsingException : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

/**
 * Throws a runtime exception if the given condition is false.
 * @param condition
 * @param error - error message
 */
inline void assert_fatal(bool condition,
                         std::string_view printable_path,
                         std::string error) {
  if (!condition) {
    throw ConfigParsingException(fmt::format("{}: {}", printable_path, error));
  }
}

inline logger::LogLevel getLogLevel(std::string level_str,
                                    std::string_view printable_path) {
  const auto it = config_members::LogLevels.find(level_str);
  assert_fatal(it != config_members::LogLevels.end(),
               printable_path,
               fmt::format("wrong log level `{}': must be one of `{}'",
                           level_str,
                           fmt::join(config_members::LogLevels
                                         | boost::adaptors::map_keys,
                                     "', `")));
  return it->second;
}

/**
 * A class for reading a structure from a JSON node.
 */
class JsonDeserializerImpl {
 public:
  JsonDeserializerImpl(std::optional<ConstJsonValRef> json,
                       std::optional<logger::LoggerPtr> log)
      : json_(json), printable_path_(""), log_(std::move(log)) {}

  /**
   * Load the data from rapidjson::Value. Checks the JSON type and throws
   * exception if it is wrong.
   * @tparam TDest - the type of data to read from JSON
   * @return the deserialized data
   */
  template <typename TDest>
  TDest deserialize() {
    TDest dest;
    assert_fatal(loadInto(dest), "deserialization failed");
    return dest;
  }

 private:
  JsonDeserializerImpl(std::optional<ConstJsonValRef> json,
                       std::string printable_path,
                       std::optional<logger::LoggerPtr> log)
      : json_(json),
        printable_path_(std::move(printable_path)),
        log_(std::move(log)) {}

  JsonDeserializerImpl getDictChild(std::string const &key) {
    std::optional<ConstJsonValRef> child;
    if (json_) {
      assert_fatal(json_->get().IsObject(), "must be a JSON object.");
      auto const json_obj = json_->get().GetObject();
      const auto it = json_obj.FindMember(key);
      if (it != json_obj.MemberEnd()) {
        child = it->value;
      }
    }
    if (log_) {
      log_.value()->trace("lookup {}: {}",
                          makePrintableDictChildKey(key),
                          child ? "found" : "not set");
    }
    return JsonDeserializerImpl{child, makePrintableDictChildKey(key), log_};
  }

  template <typename T>
  std::string makePrintableDictChildKey(T const &child_key) {
    return fmt::format("{}/{}", printable_path_, child_key);
  }

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  std::string makePrintableArrayElemPath(T const &index) {
    return fmt::format("{}[{}]", printable_path_, index);
  }

  template <typename F>
  bool iterateDictChildren(F f) {
    if (not json_) {
      return false;
    }
    assert_fatal(json_->get().IsObject(), "must be a JSON object.");
    auto const json_obj = json_->get().GetObject();
    for (const auto &child_json : json_obj) {
      auto const key = child_json.name.GetString();
      f(key,
        JsonDeserializerImpl{
            child_json.value, makePrintableDictChildKey(key), log_});
    }
    return true;
  }

  inline void assert_fatal(bool condition, std::string error) {
    ::assert_fatal(condition, printable_path_, error);
  }

  // ------------ loadInto(dst) ------------
  // loadInto is a set of functions that load the value from the current JSON
  // node to a given destination variable. They return false if the node is
  // absent and throw ConfigParsingException if its type is wrong.

  template <typename T>
  static constexpr bool IsIntegerLike = std::numeric_limits<T>::is_integer;

  template <typename T>
  static constexpr bool fitsType(int64_t i) {
    return static_cast<int64_t>(std::numeric_limits<T>::min()) <= i
        and i <= static_cast<int64_t>(std::numeric_limits<T>::max());
  }

  template <typename TDest>
  typename std::enable_if_t<
      IsIntegerLike<TDest> and sizeof(TDest) < sizeof(int64_t),
      bool>
  loadInto(TDest &dest) {
    if (not json_) {
      return false;
    }
    assert_fatal(json_->get().IsInt64(), "must be an integer");
    const int64_t val = json_->get().GetInt64();
    assert_fatal(fitsType<TDest>(val), "integer value out of range");
    dest = static_cast<TDest>(val);
    return true;
  }

  template <typename T>
  bool loadInto(std::shared_ptr<T> &dest) {
    std::unique_ptr<T> uniq_dest;
    if (not loadInto<std::unique_ptr<T>>(uniq_dest)) {
      return false;
    }
    dest = std::move(uniq_dest);
    return true;
  }

  template <typename Elem>
  bool loadInto(std::vector<Elem> &dest) {
    if (not json_) {
      return false;
    }
    assert_fatal(json_->get().IsArray(), "must be an array.");
    const auto arr = json_->get().GetArray();
    for (size_t i = 0; i < arr.Size(); ++i) {
      dest.emplace_back(
          JsonDeserializerImpl{arr[i], makePrintableArrayElemPath(i), log_}
              .deserialize<Elem>());
    }
    return true;  // empty vector in JSON is loaded
  }

  template <typename T>
  inline bool loadInto(std::optional<T> &dest) {
    T val;
    if (loadInto(val)) {
      dest = std::move(val);
    }
    return true;
  }

  // This is the fallback template function specialization that is overriden by
  // multiple partial specializations below.
  template <typename TDest>
  typename std::enable_if_t<not IsIntegerLike<TDest>, bool> loadInto(TDest &) {
    BOOST_THROW_EXCEPTION(
        ConfigParsingException("Wrong type. Should never reach here."));
    return false;
  }

  // ------------ end of loadInto(dst) ------------

  /**
   * Adds the children logger configs from parent logger JSON object to parent
   * logger config.
   * @param parent_config - the parent logger config
   */
  bool addChildrenLoggerConfigs(logger::LoggerManagerTree &parent_config);

  /**
   * Overrides the logger configuration with the values from JSON object.
   * @param cfg - the configuration to use as base
   */
  void updateLoggerConfig(logger::LoggerConfig &cfg);

  /**
   * Gets an optional value by a key from a JSON object.
   * @param key - the key for the requested value
   * @return the value if present in the JSON object, otherwise boost::none.
   */
  template <typename TDest, typename TKey>
  boost::optional<TDest> getOptValByKey(const TKey &key) {
    TDest val;
    return boost::make_optional(getDictChild(key).loadInto(val), val);
  }

  /// Loads a mandatory member of the current JSON object.
  template <typename TDest>
  void loadRequired(std::string const &key, TDest &dest) {
    auto child = getDictChild(key);
    ::assert_fatal(
        child.loadInto(dest), child.printable_path_, "must be present");
  }

  std::optional<ConstJsonValRef> json_;
  std::string printable_path_;
  std::optional<logger::LoggerPtr> log_;
};

// ------------ loadInto(dst) specializations ------------

template <>
inline bool JsonDeserializerImpl::loadInto(std::string &dest) {
  if (not json_) {
    return false;
  }
  assert_fatal(json_->get().IsString(), "must be a string");
  dest = json_->get().GetString();
  return true;
}

template <>
inline bool JsonDeserializerImpl::loadInto(logger::LogLevel &dest) {
  std::string level_str;
  if (not loadInto(level_str)) {
    return false;
  }
  dest = getLogLevel(level_str, printable_path_);
  return true;
}

template <>
inline bool JsonDeserializerImpl::loadInto(logger::LogPatterns &dest) {
  return iterateDictChildren(
      [&](std::string_view level, JsonDeserializerImpl pattern_raw) {
        std::string pattern_str;
        pattern_raw.assert_fatal(pattern_raw.loadInto(pattern_str),
                                 "must be a string");
        dest.setPattern(getLogLevel(std::string{level}, printable_path_),
                        pattern_str);
      });
}

template <>
inline bool JsonDeserializerImpl::loadInto(
    std::unique_ptr<logger::LoggerManagerTree> &dest) {
  logger::LoggerConfig root_config{logger::kDefaultLogLevel,
                                   logger::getDefaultLogPatterns()};
  updateLoggerConfig(root_config);
  dest = std::make_unique<logger::LoggerManagerTree>(
      std::make_shared<const logger::LoggerConfig>(std::move(root_config)));
  addChildrenLoggerConfigs(*dest);
  return true;
}

template <>
inline bool JsonDeserializerImpl::loadInto(TellerConfig::SeedAccount &dest) {
  if (not json_) {
    return false;
  }
  using namespace config_members;
  teller::validation::FieldValidator validator;

  loadRequired(AccountNumber, dest.account_number);
  if (auto error = validator.validateAccountNumber(dest.account_number)) {
    assert_fatal(false,
                 fmt::format("wrong account number `{}': {}",
                             dest.account_number,
                             error->toString()));
  }

  loadRequired(Name, dest.name);
  assert_fatal(not dest.name.empty(), "account name must not be empty");

  loadRequired(PinHash, dest.pin_hash);
  if (auto error = validator.validatePinHash(dest.pin_hash)) {
    assert_fatal(false, fmt::format("wrong PIN hash: {}", error->toString()));
  }

  loadRequired(Address, dest.address);

  if (not getDictChild(Balance).loadInto(dest.balance)) {
    dest.balance = kDefaultSeedBalance;
  }
  teller::model::Amount balance{dest.balance};
  assert_fatal(balance.isValid()
                   and balance.precision() <= teller::model::kMoneyPrecision,
               fmt::format("wrong balance `{}': must be a non-negative "
                           "decimal with at most {} fractional digits",
                           dest.balance,
                           static_cast<int>(teller::model::kMoneyPrecision)));
  return true;
}

template <>
inline bool JsonDeserializerImpl::loadInto(TellerConfig &dest) {
  using namespace config_members;
  getDictChild(AccountsPath).loadInto(dest.accounts_path);
  getDictChild(TransactionsPath).loadInto(dest.transactions_path);
  assert_fatal(not dest.accounts_path.empty()
                   and not dest.transactions_path.empty(),
               "table paths must not be empty");
  assert_fatal(dest.accounts_path != dest.transactions_path,
               "accounts and transactions tables must be different files");

  auto max_pin_attempts = getDictChild(MaxPinAttempts);
  if (max_pin_attempts.loadInto(dest.max_pin_attempts)) {
    max_pin_attempts.assert_fatal(dest.max_pin_attempts > 0,
                                  "must be greater than zero");
  }

  auto seed_accounts = getDictChild(SeedAccounts);
  seed_accounts.loadInto(dest.seed_accounts);
  if (dest.seed_accounts) {
    std::set<std::string> numbers;
    std::set<std::string> pin_hashes;
    for (const auto &seed : *dest.seed_accounts) {
      seed_accounts.assert_fatal(
          numbers.insert(seed.account_number).second,
          fmt::format("duplicate account number `{}'", seed.account_number));
      // the digest is a secret and is not printed
      seed_accounts.assert_fatal(
          pin_hashes.insert(seed.pin_hash).second,
          fmt::format("account `{}' reuses the PIN of another account",
                      seed.account_number));
    }
  }

  return getDictChild(LogSection).loadInto(dest.logger_manager);
}

// ------------ end of loadInto(dst) specializations ------------

bool JsonDeserializerImpl::addChildrenLoggerConfigs(
    logger::LoggerManagerTree &parent_config) {
  return getDictChild(config_members::LogChildrenSection)
      .iterateDictChildren([&](std::string_view child_name,
                               JsonDeserializerImpl child_conf_raw) {
        auto child_conf = parent_config.registerChild(
            std::string{child_name},
            child_conf_raw.getOptValByKey<logger::LogLevel>(
                config_members::LogLevel),
            child_conf_raw.getOptValByKey<logger::LogPatterns>(
                config_members::LogPatternsSection));
        child_conf_raw.addChildrenLoggerConfigs(*child_conf);
      });
}

void JsonDeserializerImpl::updateLoggerConfig(logger::LoggerConfig &cfg) {
  getDictChild(config_members::LogLevel).loadInto(cfg.log_level);
  getDictChild(config_members::LogPatternsSection).loadInto(cfg.patterns);
}

void reportJsonParsingError(const rapidjson::Document &doc,
                            const std::string &text) {
  if (doc.HasParseError()) {
    const size_t error_offset = doc.GetErrorOffset();
    // This ensures the unsigned string beginning position does not cross zero:
    const size_t print_offset =
        std::max(error_offset, kBadJsonPrintOffsset) - kBadJsonPrintOffsset;
    std::string json_error_buf = text.substr(print_offset, kBadJsonPrintLength);
    throw ConfigParsingException{fmt::format(
        "JSON parse error (near `{}'): {}",
        json_error_buf,
        std::string(rapidjson::GetParseError_En(doc.GetParseError())))};
  }
}

static teller::expected::Result<TellerConfig, std::string> deserializeConfig(
    const std::optional<std::string> &config_text,
    std::optional<logger::LoggerPtr> log) {
  try {
    rapidjson::Document doc;
    std::optional<ConstJsonValRef> root;
    if (config_text) {
      doc.Parse(config_text->data(), config_text->size());
      reportJsonParsingError(doc, *config_text);
      root = doc;
    }

    JsonDeserializerImpl parser(root, std::move(log));
    return parser.deserialize<TellerConfig>();
  } catch (ConfigParsingException const &e) {
    return e.what();
  }
}

teller::expected::Result<TellerConfig, std::string> parse_teller_config(
    const std::string &conf_path, std::optional<logger::LoggerPtr> log) {
  std::optional<std::string> config_text;
  if (not conf_path.empty()) {
    auto config_text_result = teller::readTextFile(conf_path);
    if (auto e = teller::expected::resultToOptionalError(config_text_result)) {
      return std::move(e).value();
    }
    config_text = std::move(config_text_result).assumeValue();
  }
  return deserializeConfig(config_text, std::move(log));
}

teller::expected::Result<TellerConfig, std::string> parse_teller_config_text(
    const std::string &config_text, std::optional<logger::LoggerPtr> log) {
  return deserializeConfig(config_text, std::move(log));
}
