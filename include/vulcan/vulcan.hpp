// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "vulcan/assets/resource.hpp"
#include "vulcan/core/config_loader.hpp"
#include "vulcan/core/json.hpp"
#include "vulcan/core/logger.hpp"
#include "vulcan/frontend/options.hpp"
#include "vulcan/htl/htl.hpp"
#include "vulcan/htl/json_dump.hpp"
#include "vulcan/network/http_message.hpp"
#include "vulcan/network/http_server.hpp"
#include "vulcan/parsers/minimal_toml.hpp"
#include "vulcan/util/filesystem.hpp"
