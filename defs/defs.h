
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

#ifndef __EPHYS_DEFS_H__
#define __EPHYS_DEFS_H__

#include <string>
#include <vector>
#include <map>
#include <stdexcept>


enum channel_type_t
  {
    MAG ,       // magnetometers
    GRAD ,      // planar gradiometers
    REF_MEG ,   // reference MEG sensors (CTF)
    EEG ,
    EOG ,
    ECG ,
    EMG ,
    MISC ,
    STIM        // trigger lines, never picked
  };


// channel selections offered to the rejection policies

enum pick_t
  {
    PICK_MAG ,
    PICK_GRAD ,
    PICK_MEG ,  // MAG + GRAD (+ REF_MEG, see ref_meg_t)
    PICK_EEG ,
    PICK_EOG ,
    PICK_ECG ,
    PICK_EMG ,
    PICK_MISC
  };

enum ref_meg_t
  {
    REF_MEG_AUTO ,
    REF_MEG_YES ,
    REF_MEG_NO
  };

enum metric_t
  {
    METRIC_STD ,
    METRIC_VAR ,
    METRIC_KURTOSIS
  };

enum detect_mode_t
  {
    DETECT_NONE ,
    DETECT_DIFF ,
    DETECT_MAXFILTER
  };

enum scan_mode_t
  {
    SCAN_DIM ,
    SCAN_SEGMENTS
  };

enum ret_mode_t
  {
    RET_BAD_INDS ,
    RET_GOOD_INDS ,
    RET_ZERO_BADS ,
    RET_NAN_BADS
  };

enum regressor_type_t
  {
    REG_CONSTANT ,
    REG_PARAMETRIC ,
    REG_CATEGORICAL ,
    REG_MEAN_EFFECTS
  };

enum perm_method_t
  {
    PERM_MAXSTAT ,
    PERM_CLUSTER
  };

enum perm_scheme_t
  {
    PERM_AUTO ,
    PERM_ROW_SHUFFLE ,
    PERM_SIGN_FLIP
  };

enum perm_metric_t
  {
    PERM_TSTATS ,
    PERM_COPES
  };

enum perm_state_t
  {
    PERM_CONFIGURED ,
    PERM_RUNNING ,
    PERM_COMPLETE
  };


// thrown by Helper::halt()

struct ephys_error : public std::runtime_error
{
  explicit ephys_error( const std::string & msg ) : std::runtime_error( msg ) { }
};


struct globals
{

  static std::string version;
  static std::string date;

  // logging modes
  static bool silent;
  static bool api_mode;
  static bool cache_log;

  // alternate handlers for errors and log output
  static void (*bail_function) ( const std::string & msg );
  static void (*logger_function) ( const std::string & msg );

  // keyword tables
  static std::map<std::string,pick_t> pick_kw;
  static std::map<std::string,metric_t> metric_kw;
  static std::map<std::string,detect_mode_t> detect_kw;
  static std::map<std::string,scan_mode_t> scan_kw;
  static std::map<std::string,ret_mode_t> ret_kw;
  static std::map<std::string,ref_meg_t> ref_meg_kw;
  static std::map<std::string,regressor_type_t> regressor_kw;
  static std::map<std::string,perm_method_t> perm_method_kw;
  static std::map<std::string,perm_scheme_t> perm_scheme_kw;
  static std::map<std::string,channel_type_t> channel_kw;

  static void init_defs();

  static void api();

  //
  // keyword <-> enum
  //

  static pick_t pick( const std::string & );
  static std::string pick( pick_t );

  static metric_t metric( const std::string & );
  static std::string metric( metric_t );

  static detect_mode_t detect_mode( const std::string & );
  static std::string detect_mode( detect_mode_t );

  static scan_mode_t scan_mode( const std::string & );

  static ret_mode_t ret_mode( const std::string & );

  static ref_meg_t ref_meg( const std::string & );

  static regressor_type_t regressor_type( const std::string & );
  static std::string regressor_type( regressor_type_t );

  static perm_method_t perm_method( const std::string & );
  static std::string perm_method( perm_method_t );

  static perm_scheme_t perm_scheme( const std::string & );
  static std::string perm_scheme( perm_scheme_t );

  static channel_type_t channel_type( const std::string & );
  static std::string channel_type( channel_type_t );

 private:

  template<typename T>
    static T lookup( const std::map<std::string,T> & kw , const std::string & s , const std::string & what );

  template<typename T>
    static std::string rlookup( const std::map<std::string,T> & kw , T t );

};

#endif
