// ecmodel: Elliptic curve model parameters framework
// Copyright 2026 The ecmodel Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "bit_iterator.hpp"
#include "field.hpp"
#include "models.hpp"
#include "montgomery.hpp"
#include "short_weierstrass_jacobian.hpp"
#include "twisted_edwards_extended.hpp"
