
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

#ifndef __EPHYS_MAIN_H__
#define __EPHYS_MAIN_H__

#include <string>
#include <map>
#include <vector>

#include "stats/ndarray.h"

struct param_t;

enum cmdline_proc_t
  {
    PROC_GESD ,
    PROC_ARTEFACTS ,
    PROC_GLM_PERM
  };

// misc helper: build params from the command line (key=value words after the command)
void build_param( param_t * , int argc , char** argv , int start );

// misc helper: return ephys version
std::string ephys_version();

// --gesd : one value per line
void proc_gesd( param_t & param );

// --artefacts : whitespace-delimited matrix
void proc_artefacts( param_t & param );

// --glm-perm : ID-keyed covariate and feature tables
void proc_glm_perm( param_t & param );

// whitespace-delimited numeric matrix, NA allowed
ndarray_t read_matrix( const std::string & filename );

// tab-delimited table with a header row; first column is the ID
void read_id_table( const std::string & filename ,
		    std::vector<std::string> * header ,
		    std::map<std::string,std::vector<double> > * rows );

#endif
