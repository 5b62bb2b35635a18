#include <reqtrace/component_registry.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char kBraceLocator[] = "brace";
constexpr const char kIndentLocator[] = "indent";
constexpr const char kLineLocator[] = "line";
constexpr const char kMarkdownRenderer[] = "markdown";
constexpr const char kJsonRenderer[] = "json";

} // namespace

namespace reqtrace {

template <typename Factory>
std::vector<std::string>
ComponentRegistry::RegisteredNames(const ComponentSet<Factory> &set) {
  std::vector<std::string> names;
  names.reserve(set.factories.size());
  for (const auto &entry : set.factories) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

template <typename Factory>
std::string ComponentRegistry::JoinNames(const ComponentSet<Factory> &set) {
  std::string message;
  for (const auto &name : RegisteredNames(set)) {
    message += message.empty() ? name : ", " + name;
  }
  return message;
}

template <typename Interface, typename Factory>
std::unique_ptr<Interface>
ComponentRegistry::CreateComponent(const std::string &name,
                                   const ComponentSet<Factory> &set,
                                   const std::string &kind) const {
  const auto target_name = name.empty() ? set.default_name : name;
  if (target_name.empty()) {
    throw std::invalid_argument("No default " + kind + " registered");
  }
  const auto found = set.factories.find(target_name);
  if (found == set.factories.end()) {
    throw std::invalid_argument("Unknown " + kind + " '" + target_name +
                                "'. Registered: " + JoinNames(set));
  }
  auto instance = found->second();
  if (!instance) {
    throw std::runtime_error("Factory for " + kind + " '" + target_name +
                             "' returned null");
  }
  return instance;
}

template <typename Factory>
void ComponentRegistry::RegisterComponent(const std::string &name,
                                          Factory factory, bool set_as_default,
                                          ComponentSet<Factory> &set) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (set.factories.count(name) != 0) {
    throw std::invalid_argument("Component with name '" + name +
                                "' already registered");
  }
  set.factories.emplace(name, std::move(factory));
  if (set_as_default || set.default_name.empty()) {
    set.default_name = name;
  }
}

void ComponentRegistry::RegisterLocator(const std::string &name,
                                        LocatorFactory factory,
                                        bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, locators_);
}

void ComponentRegistry::RegisterRenderer(const std::string &name,
                                         RendererFactory factory,
                                         bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, renderers_);
}

std::unique_ptr<UnitLocator>
ComponentRegistry::CreateLocator(const std::string &name) const {
  return CreateComponent<UnitLocator>(name, locators_, "unit locator");
}

std::unique_ptr<ReportRenderer>
ComponentRegistry::CreateRenderer(const std::string &name) const {
  return CreateComponent<ReportRenderer>(name, renderers_, "renderer");
}

std::vector<std::string> ComponentRegistry::LocatorNames() const {
  return RegisteredNames(locators_);
}

std::vector<std::string> ComponentRegistry::RendererNames() const {
  return RegisteredNames(renderers_);
}

const std::string &ComponentRegistry::DefaultLocatorName() const {
  return locators_.default_name;
}

const std::string &ComponentRegistry::DefaultRendererName() const {
  return renderers_.default_name;
}

ComponentRegistry MakeComponentRegistryWithDefaults() {
  ComponentRegistry registry;
  registry.RegisterLocator(
      kBraceLocator, []() { return std::make_unique<BraceUnitLocator>(); });
  registry.RegisterLocator(
      kIndentLocator, []() { return std::make_unique<IndentUnitLocator>(); });
  registry.RegisterLocator(
      kLineLocator, []() { return std::make_unique<SingleLineUnitLocator>(); },
      true);
  registry.RegisterRenderer(
      kMarkdownRenderer,
      []() { return std::make_unique<MarkdownReportRenderer>(); }, true);
  registry.RegisterRenderer(
      kJsonRenderer, []() { return std::make_unique<JsonReportRenderer>(); });
  return registry;
}

const ComponentRegistry &GlobalComponentRegistry() {
  static const ComponentRegistry registry = MakeComponentRegistryWithDefaults();
  return registry;
}

template std::unique_ptr<UnitLocator>
ComponentRegistry::CreateComponent<UnitLocator, ComponentRegistry::LocatorFactory>(
    const std::string &, const ComponentSet<LocatorFactory> &,
    const std::string &) const;

template std::unique_ptr<ReportRenderer>
ComponentRegistry::CreateComponent<ReportRenderer,
                                   ComponentRegistry::RendererFactory>(
    const std::string &, const ComponentSet<RendererFactory> &,
    const std::string &) const;

template void
ComponentRegistry::RegisterComponent<ComponentRegistry::LocatorFactory>(
    const std::string &, ComponentRegistry::LocatorFactory, bool,
    ComponentSet<ComponentRegistry::LocatorFactory> &);

template void
ComponentRegistry::RegisterComponent<ComponentRegistry::RendererFactory>(
    const std::string &, ComponentRegistry::RendererFactory, bool,
    ComponentSet<ComponentRegistry::RendererFactory> &);

} // namespace reqtrace
