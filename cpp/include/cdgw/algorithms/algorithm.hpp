// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "cdgw/data/settings.hpp"
#include "cdgw/utils/string_utils.hpp"

namespace cdgw::algorithms {

/**
 * @brief Base class of every CDGW algorithm
 *
 * Provides the public run() entry point, which locks the settings and then
 * forwards to the protected _run_impl() of the implementation. Locking makes
 * the configuration of a finished calculation reproducible: the settings
 * object an algorithm ran with can no longer be changed.
 *
 * @tparam Derived Abstract algorithm interface, e.g. GWCalculator
 * @tparam ReturnType Result type of run()
 * @tparam Args Input types of run()
 *
 * @code
 * class QuasiparticleSolver
 *     : public Algorithm<QuasiparticleSolver,
 *                        std::shared_ptr<data::QuasiparticleSpectrum>,
 *                        std::shared_ptr<data::SelfEnergy>> {
 *  protected:
 *   std::shared_ptr<data::QuasiparticleSpectrum> _run_impl(
 *       std::shared_ptr<data::SelfEnergy> sigma) const override;
 * };
 * @endcode
 */
template <typename Derived, typename ReturnType, typename... Args>
class Algorithm {
 public:
  Algorithm() = default;
  virtual ~Algorithm() = default;

  /**
   * @brief Lock the settings and run the algorithm
   *
   * @param args Inputs forwarded to _run_impl()
   * @return Result of _run_impl()
   */
  virtual ReturnType run(Args... args) const {
    this->lock_settings();
    return this->_run_impl(std::forward<Args>(args)...);
  }

  /**
   * @brief Mutable access to the settings, valid until the first run()
   */
  data::Settings& settings() { return *_settings; }

  const data::Settings& settings() const { return *_settings; }

  /**
   * @brief Registered name of the implementation
   */
  virtual std::string name() const = 0;

  /**
   * @brief All names the implementation is registered under
   *
   * Includes the primary name. Defaults to the primary name only.
   */
  virtual std::vector<std::string> aliases() const { return {this->name()}; }

  /**
   * @brief Name of the algorithm interface, shared by its implementations
   */
  virtual std::string type_name() const = 0;

 protected:
  void lock_settings() const { this->_settings->lock(); }

  virtual ReturnType _run_impl(Args... args) const = 0;

  /// Replaced by implementations with their own Settings subclass
  std::unique_ptr<data::Settings> _settings =
      std::make_unique<data::Settings>();
};

/**
 * @brief Name-keyed registry of the implementations of one algorithm
 * interface
 *
 * Each factory derives from this template and supplies three static
 * functions: algorithm_type_name(), default_algorithm_name() and
 * register_default_instances(). The built-in implementations are registered
 * lazily on first access to the registry.
 *
 * @code
 * auto gw = cdgw::algorithms::GWCalculatorFactory::create();  // default
 * auto qp = cdgw::algorithms::QuasiparticleSolverFactory::create("graphical");
 * @endcode
 *
 * @tparam BaseAlgorithmType Algorithm interface created by the factory
 * @tparam Derived The concrete factory (CRTP)
 */
template <typename BaseAlgorithmType, typename Derived>
class AlgorithmFactory {
 public:
  using return_type = std::unique_ptr<BaseAlgorithmType>;
  using functor_type = std::function<return_type(void)>;

  /**
   * @brief Create an implementation by name or alias
   *
   * @param name Registered name; empty selects the default implementation
   * @return New instance with default settings
   * @throws std::runtime_error if nothing is registered under the name
   */
  static return_type create(const std::string& name = "") {
    const std::string key =
        name.empty() ? Derived::default_algorithm_name() : name;

    auto it = registry().find(key);
    if (it == registry().end()) {
      throw std::runtime_error("Algorithm factory for " +
                               Derived::algorithm_type_name() +
                               ": no algorithm named '" + key +
                               "', available options are: " +
                               utils::join(available(), ", "));
    }
    return it->second();
  }

  /**
   * @brief Register an implementation under its name and all its aliases
   *
   * @param func Creator of the implementation
   * @throws std::runtime_error if the implementation belongs to a different
   *         algorithm type or one of its names is already taken
   */
  static void register_instance(functor_type func) {
    auto& reg = registry();
    auto probe = func();

    if (probe->type_name() != Derived::algorithm_type_name()) {
      throw std::runtime_error(
          "Algorithm factory for " + Derived::algorithm_type_name() +
          ": algorithm '" + probe->name() + "' has algorithm type '" +
          probe->type_name() + "'");
    }

    const auto aliases = probe->aliases();
    for (const auto& alias : aliases) {
      if (reg.find(alias) != reg.end()) {
        throw std::runtime_error("Algorithm factory for " +
                                 Derived::algorithm_type_name() +
                                 ": name or alias '" + alias +
                                 "' is already registered");
      }
    }
    for (const auto& alias : aliases) {
      reg[alias] = func;
    }
  }

  /**
   * @brief Remove one registered name
   * @return Whether the name was registered
   */
  static bool unregister_instance(const std::string& key) {
    return registry().erase(key) > 0;
  }

  /**
   * @brief All registered names and aliases in alphabetical order
   */
  static std::vector<std::string> available() {
    std::vector<std::string> keys;
    for (const auto& [key, _] : registry()) {
      keys.push_back(key);
    }
    return keys;
  }

  static bool has(const std::string& key) {
    return registry().find(key) != registry().end();
  }

  /**
   * @brief Remove every registration, including the built-in ones
   */
  static void clear() { registry().clear(); }

 protected:
  /// One registry per factory; built-ins are registered on first use
  static std::map<std::string, functor_type>& registry() {
    static std::map<std::string, functor_type> instance;
    static bool initialized = false;
    if (!initialized) {
      initialized = true;
      Derived::register_default_instances();
    }
    return instance;
  }
};

}  // namespace cdgw::algorithms
