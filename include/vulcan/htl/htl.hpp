// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file htl.hpp
/// \brief HTL tree model, parser and serializer in one include.

#include "vulcan/htl/node.hpp"
#include "vulcan/htl/parser.hpp"
#include "vulcan/htl/serializer.hpp"
