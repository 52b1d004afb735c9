
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

#include "param.h"

#include "helper/helper.h"
#include "defs/defs.h"

//
// param_t
//

void param_t::add( const std::string & option , const std::string & value )
{

  if ( option == "" ) return;

  // key+=value  -->  ","-append to any existing list

  const bool append_mode = option[ option.size() - 1 ] == '+';

  if ( append_mode )
    {
      const std::string option1 = option.substr( 0 , option.size() - 1 );
      if ( option1 == "" ) return;
      if ( opt.find( option1 ) == opt.end() )
	opt[ option1 ] = value;
      else
	opt[ option1 ] = opt[ option1 ] + "," + value;
      return;
    }

  // else check no doubles unless in API mode
  if ( ! globals::api_mode )
    if ( opt.find( option ) != opt.end() )
      Helper::halt( option + " parameter specified twice, only one value would be retained" );

  opt[ option ] = value;

}


int param_t::size() const
{
  return opt.size();
}


void param_t::parse( const std::string & s )
{
  // split on the first '=' only, i.e. key=value=2 sets "value=2" to 'key'
  const std::size_t p = s.find( '=' );
  if ( p == std::string::npos )
    add( s , "__null__" );
  else
    add( s.substr( 0 , p ) , s.substr( p + 1 ) );
}


void param_t::clear()
{
  opt.clear();
}

bool param_t::has( const std::string & s ) const
{
  return opt.find(s) != opt.end();
}

bool param_t::empty( const std::string & s ) const
{
  if ( ! has( s ) ) return true;
  return opt.find( s )->second == "__null__";
}

bool param_t::yesno( const std::string & s , const bool default1 , const bool default2 ) const
{
  if ( ! has( s ) ) return default1;
  if ( empty( s ) ) return default2;
  return Helper::yesno( opt.find( s )->second ) ;
}

std::string param_t::value( const std::string & s , const bool uppercase ) const
{
  if ( ! has( s ) ) return "";
  const std::string & v = opt.find( s )->second;
  if ( v == "__null__" ) return "";
  return uppercase ? Helper::unquote( Helper::toupper( v ) ) : Helper::unquote( v );
}

std::string param_t::requires( const std::string & s , const bool uppercase ) const
{
  if ( ! has(s) ) Helper::halt( "command requires parameter " + s );
  return value(s, uppercase );
}

int param_t::requires_int( const std::string & s ) const
{
  if ( ! has(s) ) Helper::halt( "command requires parameter " + s );
  int r = 0;
  if ( ! Helper::str2int( value(s) , &r ) )
    Helper::halt( "command requires parameter " + s + " to have an integer value" );
  return r;
}

double param_t::requires_dbl( const std::string & s ) const
{
  if ( ! has(s) ) Helper::halt( "command requires parameter " + s );
  double r = 0;
  if ( ! Helper::str2dbl( value(s) , &r ) )
    Helper::halt( "command requires parameter " + s + " to have a numeric value" );
  return r;
}

int param_t::get_int( const std::string & s , int def ) const
{
  return has( s ) ? requires_int( s ) : def ;
}

double param_t::get_dbl( const std::string & s , double def ) const
{
  return has( s ) ? requires_dbl( s ) : def ;
}

std::vector<std::string> param_t::strvector( const std::string & k , const std::string delim , const bool uppercase ) const
{
  std::vector<std::string> s;
  if ( ! has(k) ) return s;
  std::vector<std::string> tok = Helper::parse( value(k,uppercase) , delim );
  for (int i=0;i<tok.size();i++)
    s.push_back( Helper::unquote( tok[i]) );
  return s;
}

std::vector<double> param_t::dblvector( const std::string & k , const std::string delim ) const
{
  std::vector<double> s;
  if ( ! has(k) ) return s;
  std::vector<std::string> tok = Helper::parse( value(k) , delim );
  for (int i=0;i<tok.size();i++)
    {
      std::string str = Helper::unquote( tok[i]);
      double d = 0;
      if ( ! Helper::str2dbl( str , &d ) ) Helper::halt( "Option " + k + " requires a double value(s)" );
      s.push_back(d);
    }
  return s;
}
