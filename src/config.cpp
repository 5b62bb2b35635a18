#include <reqtrace/config.h>

#include <reqtrace/comment_styles.h>
#include <reqtrace/errors.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_map>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace reqtrace {
namespace {

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

const std::vector<std::string> &SpecKeys() {
  static const std::vector<std::string> keys = {"name", "prefix", "include",
                                                "impls"};
  return keys;
}

const std::vector<std::string> &ImplKeys() {
  static const std::vector<std::string> keys = {"name", "include", "exclude",
                                                "test_include"};
  return keys;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key,
                                  const std::string &section,
                                  const std::vector<std::string> &supported) {
  std::string message =
      "Unknown " + section + " key: " + key + ". Supported keys: ";
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw ConfigError(message);
}

std::string NormalizeAndValidateKey(const YAML::Node &key_node,
                                    const std::string &section,
                                    const std::vector<std::string> &supported) {
  const auto key = key_node.as<std::string>();
  const auto normalized = NormalizeConfigKey(key);
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key, section, supported);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw ConfigError("Config key '" + key_name + "' must be a string value");
  }
  return Trim(node.as<std::string>());
}

std::vector<std::string> ExtractPatternList(const YAML::Node &node,
                                            const std::string &key_name) {
  std::vector<std::string> values;
  const auto append = [&](const YAML::Node &child) {
    if (!child.IsScalar()) {
      throw ConfigError("Config key '" + key_name +
                        "' must be a list of strings");
    }
    auto value = Trim(child.as<std::string>());
    if (!value.empty() &&
        std::find(values.begin(), values.end(), value) == values.end()) {
      values.push_back(std::move(value));
    }
  };
  if (node.IsSequence()) {
    for (const auto &child : node) {
      append(child);
    }
    return values;
  }
  if (node.IsScalar()) {
    append(node);
    return values;
  }
  if (node.IsNull()) {
    return values;
  }
  throw ConfigError("Config key '" + key_name +
                    "' must be a string or list of strings");
}

bool IsValidPrefix(const std::string &prefix) {
  return !prefix.empty() &&
         std::all_of(prefix.begin(), prefix.end(), [](char character) {
           return std::isalnum(static_cast<unsigned char>(character)) != 0 ||
                  character == '_' || character == '-';
         });
}

ImplConfig ParseImpl(const YAML::Node &node, const std::string &spec_name) {
  if (!node.IsMap()) {
    throw ConfigError("Each impl of spec '" + spec_name +
                      "' must be a mapping");
  }
  ImplConfig impl;
  for (const auto &entry : node) {
    const auto key = NormalizeAndValidateKey(entry.first, "impl", ImplKeys());
    if (key == "name") {
      impl.name = ExtractStringScalar(entry.second, key);
    } else if (key == "include") {
      impl.include = ExtractPatternList(entry.second, key);
    } else if (key == "exclude") {
      impl.exclude = ExtractPatternList(entry.second, key);
    } else if (key == "test_include") {
      impl.test_include = ExtractPatternList(entry.second, key);
    }
  }
  if (impl.name.empty()) {
    throw ConfigError("An impl of spec '" + spec_name + "' has no name");
  }
  if (impl.name.find('/') != std::string::npos) {
    throw ConfigError("Impl name '" + impl.name + "' must not contain '/'");
  }
  return impl;
}

SpecConfig ParseSpec(const YAML::Node &node) {
  if (!node.IsMap()) {
    throw ConfigError("Each entry of 'specs' must be a mapping");
  }
  SpecConfig spec;
  YAML::Node impls;
  for (const auto &entry : node) {
    const auto key = NormalizeAndValidateKey(entry.first, "spec", SpecKeys());
    if (key == "name") {
      spec.name = ExtractStringScalar(entry.second, key);
    } else if (key == "prefix") {
      spec.prefix = ExtractStringScalar(entry.second, key);
    } else if (key == "include") {
      spec.include = ExtractPatternList(entry.second, key);
    } else if (key == "impls") {
      impls = entry.second;
    }
  }
  if (spec.name.empty()) {
    throw ConfigError("A spec has no name");
  }
  if (spec.name.find('/') != std::string::npos) {
    throw ConfigError("Spec name '" + spec.name + "' must not contain '/'");
  }
  if (!IsValidPrefix(spec.prefix)) {
    throw ConfigError("Spec '" + spec.name +
                      "' needs a prefix of letters, digits, '_' or '-'");
  }

  if (impls && !impls.IsNull()) {
    if (!impls.IsSequence()) {
      throw ConfigError("Spec '" + spec.name + "' impls must be a list");
    }
    std::set<std::string> names;
    for (const auto &child : impls) {
      auto impl = ParseImpl(child, spec.name);
      if (!names.insert(impl.name).second) {
        throw ConfigError("Spec '" + spec.name + "' declares impl '" +
                          impl.name + "' twice");
      }
      spec.impls.push_back(std::move(impl));
    }
  }
  return spec;
}

std::map<std::string, std::string> ParseLanguages(const YAML::Node &node) {
  if (!node.IsMap()) {
    throw ConfigError("Config key 'languages' must map extensions to "
                      "comment families");
  }
  std::map<std::string, std::string> languages;
  for (const auto &entry : node) {
    const auto extension = Trim(entry.first.as<std::string>());
    const auto family = ToLower(ExtractStringScalar(entry.second, extension));
    // Rejects unknown families up front rather than at rebuild time.
    CommentFamily(family);
    languages[extension] = family;
  }
  return languages;
}

ProjectConfig ParseRoot(const YAML::Node &root,
                        const std::filesystem::path &project_root) {
  if (!root.IsMap()) {
    throw ConfigError("Config file must contain a mapping at the root");
  }

  ProjectConfig config;
  config.trace.root_path = project_root.string();
  std::set<std::string> names;
  for (const auto &entry : root) {
    const auto key =
        NormalizeAndValidateKey(entry.first, "config", SupportedConfigKeys());
    if (key == "log_level") {
      try {
        config.log_level =
            ParseLogLevel(ExtractStringScalar(entry.second, key));
      } catch (const ConfigError &) {
        throw;
      } catch (const std::invalid_argument &error) {
        throw ConfigError(error.what());
      }
    } else if (key == "languages") {
      config.trace.languages = ParseLanguages(entry.second);
    } else if (key == "specs") {
      if (!entry.second.IsSequence()) {
        throw ConfigError("Config key 'specs' must be a list");
      }
      for (const auto &child : entry.second) {
        auto spec = ParseSpec(child);
        if (!names.insert(spec.name).second) {
          throw ConfigError("Spec '" + spec.name + "' is declared twice");
        }
        config.trace.specs.push_back(std::move(spec));
      }
    }
  }
  return config;
}

} // namespace

std::filesystem::path DefaultConfigPath(const std::filesystem::path &root) {
  return root / ".config" / "reqtrace" / "config.yaml";
}

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {"log_level", "languages",
                                                "specs"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"implementations", "impls"},
      {"impl", "impls"},
      {"test_includes", "test_include"},
      {"tests", "test_include"},
      {"log", "log_level"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

ProjectConfig ParseConfigFile(const std::filesystem::path &path,
                              const std::filesystem::path &root) {
  if (!std::filesystem::exists(path)) {
    throw ConfigError("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw ConfigError("Unsupported config format: " + extension);
  }

  try {
    auto config = ParseRoot(YAML::LoadFile(path.string()), root);
    config.config_file = path;
    return config;
  } catch (const YAML::Exception &error) {
    throw ConfigError("Failed to parse " + path.string() + ": " + error.what());
  }
}

ProjectConfig ParseConfigString(const std::string &document,
                                const std::filesystem::path &root) {
  try {
    return ParseRoot(YAML::Load(document), root);
  } catch (const YAML::Exception &error) {
    throw ConfigError(std::string("Failed to parse config: ") + error.what());
  }
}

} // namespace reqtrace
