/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/configurator.hpp"

namespace sealbox::log {

  namespace {
    constexpr std::string_view kEmbeddedConfig = R"(
sinks:
  - name: console
    type: console
    stream: stderr
    thread: none
    color: false
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: libp2p
        level: off
      - name: sealbox
        children:
          - name: application
          - name: validator
          - name: sandbox
            children:
              - name: host_api
          - name: runtime
            children:
              - name: wasmedge
              - name: module_cache
          - name: receipt
          - name: crypto
)";
  }  // namespace

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous)
      : Configurator(std::move(previous), std::string{kEmbeddedConfig}) {}

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous,
                             std::string config)
      : ConfiguratorFromYAML(std::move(previous), std::move(config)) {}

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous,
                             std::filesystem::path path)
      : ConfiguratorFromYAML(std::move(previous), std::move(path)) {}

}  // namespace sealbox::log
