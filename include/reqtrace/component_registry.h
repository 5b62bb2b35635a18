#pragma once

#include <reqtrace/report_renderer.h>
#include <reqtrace/unit_locator.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace reqtrace {

class ComponentRegistry {
public:
  using LocatorFactory = std::function<std::unique_ptr<UnitLocator>()>;
  using RendererFactory = std::function<std::unique_ptr<ReportRenderer>()>;

  void RegisterLocator(const std::string &name, LocatorFactory factory,
                       bool set_as_default = false);
  void RegisterRenderer(const std::string &name, RendererFactory factory,
                        bool set_as_default = false);

  std::unique_ptr<UnitLocator> CreateLocator(const std::string &name = "") const;
  std::unique_ptr<ReportRenderer>
  CreateRenderer(const std::string &name = "") const;

  std::vector<std::string> LocatorNames() const;
  std::vector<std::string> RendererNames() const;

  const std::string &DefaultLocatorName() const;
  const std::string &DefaultRendererName() const;

  template <typename Factory>
  struct ComponentSet {
    std::unordered_map<std::string, Factory> factories;
    std::string default_name;
  };

private:
  template <typename Factory>
  static std::vector<std::string>
  RegisteredNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static std::string JoinNames(const ComponentSet<Factory> &set);

  template <typename Interface, typename Factory>
  std::unique_ptr<Interface>
  CreateComponent(const std::string &name, const ComponentSet<Factory> &set,
                  const std::string &kind) const;

  template <typename Factory>
  void RegisterComponent(const std::string &name, Factory factory,
                         bool set_as_default, ComponentSet<Factory> &set);

  ComponentSet<LocatorFactory> locators_;
  ComponentSet<RendererFactory> renderers_;
};

// Locators: brace, indent, line (default). Renderers: markdown (default),
// json.
ComponentRegistry MakeComponentRegistryWithDefaults();
const ComponentRegistry &GlobalComponentRegistry();

} // namespace reqtrace
