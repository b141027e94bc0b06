/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <wasmedge/wasmedge.h>

#include "host_api/capability_sandbox.hpp"
#include "host_api/host_api.hpp"

namespace sealbox::runtime::wasm_edge {

  /**
   * Adds the host functions of \param bound_imports, and nothing else, to
   * the `env` module \param instance. Calls are dispatched to
   * \param host_api, which must outlive the instance.
   */
  void registerHostApi(host_api::HostApi &host_api,
                       const host_api::BoundImports &bound_imports,
                       WasmEdge_ModuleInstanceContext *instance);

}  // namespace sealbox::runtime::wasm_edge
