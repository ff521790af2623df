#include "HostConfig.hpp"

#include "SimpleIni.h"
#include "sago/platform_folders.h"

namespace ptymux {
namespace {
int64_t readPositive(CSimpleIniA& ini, const char* section, const char* key,
                     int64_t defaultValue) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return defaultValue;
  }
  int64_t parsed;
  try {
    size_t consumed;
    parsed = std::stoll(value, &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument(value);
    }
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid value for [") + section + "] " +
                             key + ": " + value);
  }
  if (parsed <= 0) {
    throw std::runtime_error(string("[") + section + "] " + key +
                             " must be positive");
  }
  return parsed;
}

HostConfig fromIni(CSimpleIniA& ini) {
  HostConfig config;

  const char* shell = ini.GetValue("Terminal", "shell", NULL);
  if (shell != NULL && !trim(shell).empty()) {
    config.shell = trim(shell);
  }

  config.output.flushInterval = std::chrono::milliseconds(readPositive(
      ini, "Output", "flush_interval_ms", config.output.flushInterval.count()));
  config.output.maxBatchBytes = size_t(readPositive(
      ini, "Output", "max_batch_bytes", int64_t(config.output.maxBatchBytes)));
  config.output.readChunkBytes = size_t(readPositive(
      ini, "Output", "read_chunk_bytes", int64_t(config.output.readChunkBytes)));

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    config.verbose = atoi(vlevel);
  }
  const char* silent = ini.GetValue("Debug", "silent", NULL);
  if (silent && atoi(silent) != 0) {
    config.silent = true;
  }
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    // make sure maxLogSize is a string of int value
    config.maxLogSize = to_string(atoi(logsize));
  }
  return config;
}
}  // namespace

string HostConfigLoader::defaultPath() {
  return sago::getConfigHome() + "/ptymux/ptymux.ini";
}

HostConfig HostConfigLoader::loadFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }
  LOG(INFO) << "Loaded config from " << path;
  return fromIni(ini);
}

HostConfig HostConfigLoader::parse(const string& contents) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(contents.c_str(), contents.size());
  if (rc < 0) {
    throw std::runtime_error("Invalid config data");
  }
  return fromIni(ini);
}
}  // namespace ptymux
