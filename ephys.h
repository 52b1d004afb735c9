
//    --------------------------------------------------------------------
//
//    This file is part of ephys.
//
//    ephys is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    ephys is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with ephys. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#ifndef __EPHYS_H__
#define __EPHYS_H__

#include <cstddef>

#include "param.h"

#include "defs/defs.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include "miscmath/miscmath.h"
#include "miscmath/crandom.h"

#include <Eigen/Dense>
#include "stats/statistics.h"
#include "stats/gesd.h"
#include "stats/ndarray.h"
#include "stats/design.h"
#include "stats/glm.h"
#include "stats/cluster.h"
#include "stats/perm.h"

#include "annot/annot.h"

#include "dataset/dataset.h"

#include "artifacts/artifacts.h"
#include "artifacts/maxfilt.h"
#include "artifacts/reject.h"

#endif
