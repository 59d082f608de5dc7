/* Copyright (c) 2026, The Locus Authors
 *
 * This file is part of Locus
 *
 * This library is free software; you can redistribute it and/or modify it under
 * the terms of the GNU Lesser General Public License version 2.1 as published
 * by the Free Software Foundation.
 *
 * This library is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this library; if not, write to the Free Software Foundation, Inc.,
 * 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

#include "object.h"

#include "exception.h"
#include "log.h"

#include <lunchbox/debug.h>

#include <map>

namespace locus
{
namespace detail
{
class Object
{
public:
    typedef std::map< std::string, locus::Object::Method > Methods;
    typedef Methods::const_iterator MethodsCIter;

    Methods methods;
};
}

Object::Object()
    : _impl( new detail::Object )
{}

Object::~Object()
{
    delete _impl;
}

void Object::registerMethod( const std::string& name, const Method& method )
{
    LBASSERT( method );
    _impl->methods[ name ] = method;
}

std::string Object::invoke( const std::string& name, const Strings& args )
{
    detail::Object::MethodsCIter i = _impl->methods.find( name );
    if( i == _impl->methods.end( ))
        throw Exception( Exception::INVOCATION, "Unknown method " + name );

    return i->second( args );
}

bool Object::hasMethod( const std::string& name ) const
{
    return _impl->methods.find( name ) != _impl->methods.end();
}

Strings Object::getMethodNames() const
{
    Strings names;
    names.reserve( _impl->methods.size( ));
    for( detail::Object::MethodsCIter i = _impl->methods.begin();
         i != _impl->methods.end(); ++i )
    {
        names.push_back( i->first );
    }
    return names;
}

}
