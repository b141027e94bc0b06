/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace sealbox::log {

  /**
   * YAML configurator carrying the sealbox group tree. Without an explicit
   * config the embedded one is used: everything goes to stderr, level info.
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
    using PrevConfigurator = soralog::Configurator;

   public:
    explicit Configurator(std::shared_ptr<PrevConfigurator> previous);

    Configurator(std::shared_ptr<PrevConfigurator> previous,
                 std::string config);

    Configurator(std::shared_ptr<PrevConfigurator> previous,
                 std::filesystem::path path);
  };

}  // namespace sealbox::log
