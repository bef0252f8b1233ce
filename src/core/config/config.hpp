#pragma once

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <spdlog/spdlog.h>
#include "../../common/i18n/strings.hpp"

namespace tunebox {

// Read-only settings. Only an explicitly named file is ever opened; without
// one the built-in defaults apply. Nothing is written back.
class Config {
private:
  rapidjson::Document config;
  std::string config_path;
  std::string last_error;

  void create_default_config() {
    config.SetObject();
    auto &allocator = config.GetAllocator();

    // UI section
    rapidjson::Value ui(rapidjson::kObjectType);
    ui.AddMember("language", "en", allocator);
    ui.AddMember("clear_screen", true, allocator);
    ui.AddMember("pause", true, allocator);
    config.AddMember("ui", ui, allocator);

    // Log section
    rapidjson::Value log(rapidjson::kObjectType);
    log.AddMember("level", "warn", allocator);
    config.AddMember("log", log, allocator);
  }

  // Copies every recognised key of `loaded` over the defaults, so a partial
  // file only changes what it names.
  void merge(const rapidjson::Document &loaded) {
    auto &allocator = config.GetAllocator();
    for (const char *section : {"ui", "log"}) {
      if (!loaded.HasMember(section) || !loaded[section].IsObject()) {
        continue;
      }
      for (auto it = loaded[section].MemberBegin(); it != loaded[section].MemberEnd(); ++it) {
        const char *key = it->name.GetString();
        if (!config[section].HasMember(key)) {
          spdlog::warn("ignoring unknown config key {}.{}", section, key);
          continue;
        }
        config[section][key].CopyFrom(it->value, allocator);
      }
    }
  }

  void set_value(const char *section, const char *key, rapidjson::Value value) {
    config[section][key] = value;
  }

  std::string get_string_value(const char *section, const char *key,
                               const std::string &default_value = "") const {
    if (config.HasMember(section) && config[section].HasMember(key) &&
        config[section][key].IsString()) {
      return config[section][key].GetString();
    }
    return default_value;
  }

  bool get_bool_value(const char *section, const char *key,
                      bool default_value = false) const {
    if (config.HasMember(section) && config[section].HasMember(key) &&
        config[section][key].IsBool()) {
      return config[section][key].GetBool();
    }
    return default_value;
  }

public:
  Config() { create_default_config(); }

  explicit Config(const std::string &path) : config_path(path) {
    create_default_config();
    if (config_path.empty()) {
      return;
    }
    try {
      std::ifstream file(config_path);
      if (!file.good()) {
        throw std::runtime_error("Cannot open " + config_path);
      }
      std::string json_str((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
      load_json(json_str);
    } catch (const std::exception &e) {
      last_error = e.what();
      std::cerr << "Config error: " << e.what() << std::endl;
    }
  }

  // Throws std::runtime_error on malformed input; the current values are kept.
  void load_json(const std::string &json_str) {
    rapidjson::Document loaded;
    if (loaded.Parse(json_str.c_str()).HasParseError()) {
      throw std::runtime_error(std::string("Invalid config file format: ") +
                               rapidjson::GetParseError_En(loaded.GetParseError()));
    }
    if (!loaded.IsObject()) {
      throw std::runtime_error("Invalid config file format: top level must be an object");
    }
    merge(loaded);
  }

  const std::string &path() const { return config_path; }
  const std::string &error() const { return last_error; }

  std::string get_language() const {
    std::string language = get_string_value("ui", "language", "en");
    return is_supported_language(language) ? language : "en";
  }

  bool get_clear_screen() const { return get_bool_value("ui", "clear_screen", true); }

  bool get_pause() const { return get_bool_value("ui", "pause", true); }

  // spdlog names ("debug", "info", "warn", "error", "off", ...). Unknown
  // names fall back to warn instead of spdlog's "off".
  spdlog::level::level_enum get_log_level() const {
    std::string name = get_string_value("log", "level", "warn");
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
      spdlog::warn("unknown log level '{}', using warn", name);
      return spdlog::level::warn;
    }
    return level;
  }

  void set_language(const std::string &language) {
    set_value("ui", "language", rapidjson::Value(language.c_str(), config.GetAllocator()));
  }

  void set_clear_screen(bool enabled) { set_value("ui", "clear_screen", rapidjson::Value(enabled)); }

  void set_pause(bool enabled) { set_value("ui", "pause", rapidjson::Value(enabled)); }

  void set_log_level(spdlog::level::level_enum level) {
    auto name = spdlog::level::to_string_view(level);
    set_value("log", "level",
              rapidjson::Value(name.data(), static_cast<rapidjson::SizeType>(name.size()),
                               config.GetAllocator()));
  }

  std::string to_json() const {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    config.Accept(writer);
    return buffer.GetString();
  }
};

} // namespace tunebox
