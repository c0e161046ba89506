/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#ifdef _WIN32
#ifdef MRN_CORE_EXPORTS
#define MRN_CORE_API __declspec(dllexport)
#else
#define MRN_CORE_API __declspec(dllimport)
#endif
#else
#define MRN_CORE_API __attribute__((visibility("default")))
#endif
