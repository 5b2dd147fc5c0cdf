// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_SIM_VERSION_HH__
#define __FTLSIM_SIM_VERSION_HH__

#define FTLSIM_VERSION "1.0"

#endif
