/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "color_loss.hpp"
#include "contextual_loss.hpp"
#include "perceptual_loss.hpp"
#include "pixel_loss.hpp"
