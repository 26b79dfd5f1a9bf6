/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SEMVER_VERSION_LOG_HPP_
#define SEMVER_VERSION_LOG_HPP_

#include "semver/common/tools/log.hpp"

#define LOG_MODULE "version"

#define LOG_DBG() LOG_MODULE_DBG(LOG_MODULE)
#define LOG_INF() LOG_MODULE_INF(LOG_MODULE)
#define LOG_WRN() LOG_MODULE_WRN(LOG_MODULE)
#define LOG_ERR() LOG_MODULE_ERR(LOG_MODULE)

#endif
