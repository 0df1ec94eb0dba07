/*
 * Copyright (c) 2014 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Version of grauto
/// \file version.hpp
#ifndef _GRAUTO_VERSION_HPP_INCLUDED
#define _GRAUTO_VERSION_HPP_INCLUDED

namespace grauto
{

#define GRAUTO_MAJOR_VERSION 0
#define GRAUTO_MINOR_VERSION 1
#define GRAUTO_PATCH_VERSION 0
#define GRAUTO_VERSION_NUMBER (GRAUTO_MAJOR_VERSION * 1000000 + GRAUTO_MINOR_VERSION * 10000 + GRAUTO_PATCH_VERSION)

#define GRAUTO_VERSION_STRING  "0.1.0"

}//namespace
#endif
