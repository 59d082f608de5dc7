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

#ifndef LOCUS_TOOLS_COUNTER_H
#define LOCUS_TOOLS_COUNTER_H

#include <locus/dataIStream.h>
#include <locus/dataOStream.h>
#include <locus/exception.h>
#include <locus/object.h>
#include <locus/objectFactory.h>

#include <lunchbox/atomic.h>

#include <boost/bind.hpp>
#include <boost/lexical_cast.hpp>

namespace locus
{
namespace tools
{
/**
 * A shared integer counter.
 *
 * Methods: <code>get</code> returns the value, <code>add n</code> adds n and
 * returns the new value.
 */
class Counter : public Object
{
public:
    Counter() : _value( 0 )
    {
        registerMethod( "get", boost::bind( &Counter::_get, this, _1 ));
        registerMethod( "add", boost::bind( &Counter::_add, this, _1 ));
    }

    void init( const Strings& args ) override
    {
        if( !args.empty( ))
            _value = boost::lexical_cast< int64_t >( args.front( ));
    }

    void getInstanceData( DataOStream& os ) override
        { os << int64_t( _value ); }

    void applyInstanceData( DataIStream& is ) override
        { _value = is.read< int64_t >(); }

private:
    lunchbox::Atomic< int64_t > _value;

    std::string _get( const Strings& )
        { return boost::lexical_cast< std::string >( int64_t( _value )); }

    std::string _add( const Strings& args )
    {
        if( args.size() != 1 )
            throw Exception( Exception::INVOCATION, "add takes one argument" );
        const int64_t value = ( _value += boost::lexical_cast< int64_t >(
                                              args.front( )));
        return boost::lexical_cast< std::string >( value );
    }
};

/** Instantiates the object types of the kernel server daemon. */
class Factory : public ObjectFactory
{
public:
    Object* createObject( const std::string& type ) override
    {
        if( type == "Counter" )
            return new Counter;
        return 0;
    }
};
}
}
#endif // LOCUS_TOOLS_COUNTER_H
