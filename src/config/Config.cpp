#include "config/Config.h"

#include <ArduinoJson.h>
#include <string.h>

#include <fstream>

#include "comms/SerialPort.h"

#define LOG_TAG "config"

/*=============================================================================
  SMALL HELPERS
=============================================================================*/

// Each reader leaves out untouched when the key is absent and fails when
// it is present with the wrong type or out of range.

template <typename T>
static bool readUnsigned(JsonObjectConst obj, const char* key, T& out) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) return true;
  if (!v.is<T>()) {
    LOG_ERROR("'%s' must be an unsigned integer in range", key);
    return false;
  }
  out = v.as<T>();
  return true;
}

static bool readBool(JsonObjectConst obj, const char* key, bool& out) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) return true;
  if (!v.is<bool>()) {
    LOG_ERROR("'%s' must be true or false", key);
    return false;
  }
  out = v.as<bool>();
  return true;
}

static bool readString(JsonObjectConst obj, const char* key, std::string& out) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) return true;
  if (!v.is<const char*>()) {
    LOG_ERROR("'%s' must be a string", key);
    return false;
  }
  out = v.as<const char*>();
  return true;
}

// Optional nested object; absent is fine, any other type is not
static bool section(JsonObjectConst root, const char* key, JsonObjectConst& out) {
  JsonVariantConst v = root[key];
  if (v.isNull()) return true;
  if (!v.is<JsonObjectConst>()) {
    LOG_ERROR("'%s' must be an object", key);
    return false;
  }
  out = v.as<JsonObjectConst>();
  return true;
}

static bool knownTopLevelKey(const char* key) {
  static const char* const kKeys[] = {"lanes", "serial", "timing", "green", "loop", "log_level"};
  for (size_t i = 0; i < sizeof(kKeys) / sizeof(kKeys[0]); ++i) {
    if (strcmp(key, kKeys[i]) == 0) return true;
  }
  return false;
}

static bool apply(JsonObjectConst root, RuntimeConfig& cfg) {
  for (JsonPairConst kv : root) {
    if (!knownTopLevelKey(kv.key().c_str())) {
      LOG_WARN("ignoring unknown key '%s'", kv.key().c_str());
    }
  }

  bool ok = readUnsigned(root, "lanes", cfg.num_lanes);

  JsonObjectConst serial, timing, green, loop;
  ok = section(root, "serial", serial) && ok;
  ok = section(root, "timing", timing) && ok;
  ok = section(root, "green", green) && ok;
  ok = section(root, "loop", loop) && ok;
  if (!ok) return false;

  if (!serial.isNull()) {
    ok = readString(serial, "port", cfg.serial_port) && ok;
    ok = readUnsigned(serial, "baud", cfg.baud) && ok;
    ok = readUnsigned(serial, "open_timeout_ms", cfg.open_timeout_ms) && ok;
    ok = readUnsigned(serial, "settle_ms", cfg.settle_ms) && ok;
    ok = readUnsigned(serial, "warn_interval_ms", cfg.warn_interval_ms) && ok;
  }

  if (!timing.isNull()) {
    ok = readUnsigned(timing, "yellow_clearance_ms", cfg.yellow_clearance_ms) && ok;
  }

  if (!green.isNull()) {
    ok = readUnsigned(green, "first_s", cfg.green_first_s) && ok;
    ok = readUnsigned(green, "interior_s", cfg.green_interior_s) && ok;
    ok = readUnsigned(green, "last_s", cfg.green_last_s) && ok;
    ok = readUnsigned(green, "min_s", cfg.green_min_s) && ok;
    ok = readUnsigned(green, "max_s", cfg.green_max_s) && ok;
  }

  if (!loop.isNull()) {
    ok = readUnsigned(loop, "control_hz", cfg.control_hz) && ok;
    ok = readUnsigned(loop, "status_hz", cfg.status_hz) && ok;
    ok = readBool(loop, "status_enabled", cfg.status_enabled) && ok;
    ok = readBool(loop, "honor_green_duration", cfg.honor_green_duration) && ok;
  }

  std::string level_name;
  ok = readString(root, "log_level", level_name) && ok;
  if (!level_name.empty() && !logging::parseLevel(level_name.c_str(), cfg.log_level)) {
    LOG_ERROR("unknown log_level '%s'", level_name.c_str());
    ok = false;
  }

  return ok;
}

static bool applyDocument(const DynamicJsonDocument& doc, RuntimeConfig& cfg) {
  if (!doc.is<JsonObjectConst>()) {
    LOG_ERROR("top level must be a JSON object");
    return false;
  }

  RuntimeConfig next = cfg;
  if (!apply(doc.as<JsonObjectConst>(), next)) return false;
  if (!config::validate(next)) return false;

  cfg = next;
  return true;
}


namespace config {

bool loadJson(const char* text, RuntimeConfig& cfg) {
  if (!text) return false;

  DynamicJsonDocument doc(CONFIG_JSON_DOC_BYTES);
  DeserializationError err = deserializeJson(doc, text);
  if (err) {
    LOG_ERROR("config parse error: %s", err.c_str());
    return false;
  }
  return applyDocument(doc, cfg);
}

bool loadFile(const char* path, RuntimeConfig& cfg) {
  if (!path) return false;

  std::ifstream in(path);
  if (!in) {
    LOG_ERROR("cannot open config file %s", path);
    return false;
  }

  DynamicJsonDocument doc(CONFIG_JSON_DOC_BYTES);
  DeserializationError err = deserializeJson(doc, in);
  if (err) {
    LOG_ERROR("%s: parse error: %s", path, err.c_str());
    return false;
  }

  if (!applyDocument(doc, cfg)) {
    LOG_ERROR("%s: rejected", path);
    return false;
  }

  LOG_INFO("loaded %s", path);
  return true;
}

bool validate(RuntimeConfig& cfg) {
  bool ok = true;

  if (cfg.num_lanes == 0 || cfg.num_lanes > MAX_LANES) {
    LOG_ERROR("lanes must be 1..%u (got %u)", (unsigned)MAX_LANES, (unsigned)cfg.num_lanes);
    ok = false;
  }
  if (cfg.serial_port.empty()) {
    LOG_ERROR("serial.port must not be empty");
    ok = false;
  }
  if (!SerialPort::baudSupported(cfg.baud)) {
    LOG_ERROR("serial.baud %lu not supported", (unsigned long)cfg.baud);
    ok = false;
  }
  if (cfg.control_hz == 0) {
    LOG_ERROR("loop.control_hz must be > 0");
    ok = false;
  }
  if (cfg.status_enabled && cfg.status_hz == 0) {
    LOG_ERROR("loop.status_hz must be > 0 when status lines are enabled");
    ok = false;
  }

  if (cfg.green_min_s < GREEN_FLOOR_S) {
    LOG_WARN("green.min_s %u raised to %u", (unsigned)cfg.green_min_s, (unsigned)GREEN_FLOOR_S);
    cfg.green_min_s = GREEN_FLOOR_S;
  }
  if (cfg.green_max_s < cfg.green_min_s) {
    LOG_ERROR("green.max_s (%u) < green.min_s (%u)",
              (unsigned)cfg.green_max_s, (unsigned)cfg.green_min_s);
    ok = false;
  }

  return ok;
}

SerialLink::Params linkParams(const RuntimeConfig& cfg) {
  SerialLink::Params p;
  p.device = cfg.serial_port.c_str();
  p.baud = cfg.baud;
  p.open_timeout_ms = cfg.open_timeout_ms;
  p.settle_ms = cfg.settle_ms;
  p.warn_interval_ms = cfg.warn_interval_ms;
  return p;
}

LaneScheduler::DurationParams durationParams(const RuntimeConfig& cfg) {
  LaneScheduler::DurationParams p;
  p.first_s = cfg.green_first_s;
  p.interior_s = cfg.green_interior_s;
  p.last_s = cfg.green_last_s;
  p.min_s = cfg.green_min_s;
  p.max_s = cfg.green_max_s;
  return p;
}

TransitionController::Params transitionParams(const RuntimeConfig& cfg) {
  TransitionController::Params p;
  p.num_lanes = cfg.num_lanes;
  p.clearance_ms = cfg.yellow_clearance_ms;
  p.min_green_s = cfg.green_min_s;
  p.max_green_s = cfg.green_max_s;
  return p;
}

ControlLoop::Params loopParams(const RuntimeConfig& cfg) {
  ControlLoop::Params p;
  p.num_lanes = cfg.num_lanes;
  p.control_hz = cfg.control_hz;
  p.status_hz = cfg.status_hz;
  p.status_enabled = cfg.status_enabled;
  p.honor_green_duration = cfg.honor_green_duration;
  return p;
}

}  // namespace config
