# include "../../queries/filter.hpp"
# include "../value-tools.hpp"
# include "query-tools.hpp"
# include "../../compat.hpp"
# include <mtc/wcsstr.h>
# include <stdexcept>

namespace arbor {
namespace queries {

  // Filter implementation

  Filter::Filter():
    opcode( Presence ),
    attribute( "objectClass" )  {}

  Filter::Filter( unsigned op, const std::string& attr, const std::string& value ):
    opcode( op ),
    attribute( attr ),
    argument( value )
  {
    if ( opcode >= And )
      throw std::logic_error( "compound filter requires the list of subfilters" );
    if ( opcode != Literal && attribute.empty() )
      throw std::invalid_argument( "filter attribute name must not be empty" );
  }

  Filter::Filter( unsigned op, std::vector<Filter>&& items ):
    opcode( op ),
    subitems( std::move( items ) )
  {
    if ( opcode < And )
      throw std::logic_error( "simple filter can not hold subfilters" );
    if ( subitems.empty() )
      throw std::invalid_argument( "compound filter requires at least one subfilter" );
    if ( opcode == Not && subitems.size() != 1 )
      throw std::invalid_argument( "negation requires exactly one subfilter" );
  }

  auto  Filter::to_string() const -> std::string
  {
    auto  output = std::string();

    switch ( opcode )
    {
      case Literal:
        return argument;
      case Presence:
        return "(" + attribute + "=*)";
      case Equality:
        return "(" + attribute + "=" + EscapeFilterValue( argument ) + ")";
      case Substring:
        return "(" + attribute + "=" + EscapeFilterValue( argument, true ) + ")";
      case GreaterOrEqual:
        return "(" + attribute + ">=" + EscapeFilterValue( argument ) + ")";
      case LessOrEqual:
        return "(" + attribute + "<=" + EscapeFilterValue( argument ) + ")";
      case Approx:
        return "(" + attribute + "~=" + EscapeFilterValue( argument ) + ")";
      case And:   output = "(&";  break;
      case Or:    output = "(|";  break;
      case Not:   output = "(!";  break;
      default:
        throw std::logic_error( "invalid filter operation code" );
    }

    for ( auto& next: subitems )
      output += next.to_string();

    return output += ')';
  }

  bool  Filter::operator == ( const Filter& f ) const
  {
    return opcode == f.opcode
      && attribute == f.attribute
      && argument == f.argument
      && subitems == f.subitems;
  }

  // escaping

  auto  EscapeFilterValue( const std::string& value, bool keepStars ) -> std::string
  {
    auto  output = std::string();

    for ( auto chr: value )
      switch ( chr )
      {
        case '*':
          if ( keepStars )  output += chr;
            else output += "\\2a";
          break;
        case '(':   output += "\\28";  break;
        case ')':   output += "\\29";  break;
        case '\\':  output += "\\5c";  break;
        case '\0':  output += "\\00";  break;
        default:    output += chr;
      }

    return output;
  }

  // compiler helpers

  static  auto  Parenthesize( const std::string& str ) -> std::string
  {
    auto  pbeg = str.find_first_not_of( " \t" );
    auto  pend = str.find_last_not_of( " \t" );

    if ( pbeg == std::string::npos )
      throw std::invalid_argument( "invalid (empty) filter string passed" );

    auto  trim = str.substr( pbeg, pend - pbeg + 1 );

    return trim.front() == '(' ? trim : "(" + trim + ")";
  }

  static  auto  MakeMatch( const std::string& attr, const std::string& op, const std::string& value ) -> Filter
  {
    if ( op == "=" )
    {
      if ( value == "*" )
        return Filter( Filter::Presence, attr );
      if ( value.find( '*' ) != std::string::npos )
        return Filter( Filter::Substring, attr, value );
      return Filter( Filter::Equality, attr, value );
    }
    if ( op == "~=" )
      return Filter( Filter::Approx, attr, value );
    if ( op == ">=" )
      return Filter( Filter::GreaterOrEqual, attr, value );
    if ( op == "<=" )
      return Filter( Filter::LessOrEqual, attr, value );
    if ( op == "!=" )
      return Filter( Filter::Not, { MakeMatch( attr, "=", value ) } );
    throw std::invalid_argument( mtc::strprintf( "unknown filter comparison operator '%s'", op.c_str() ) );
  }

  static  auto  MakeMatch( const std::string& attr, const std::string& op, const mtc::zval& value ) -> Filter
  {
    if ( value.get_type() == mtc::zval::z_zmap )
      throw std::invalid_argument( mtc::strprintf( "structure is not allowed as '%s' value", attr.c_str() ) );

    auto  values = GetStrings( value );
    auto  orlist = std::vector<Filter>();

    if ( values.empty() )
      throw std::invalid_argument( mtc::strprintf( "empty list of values for '%s'", attr.c_str() ) );

    if ( values.size() == 1 )
      return MakeMatch( attr, op, values.front() );

    for ( auto& next: values )
      orlist.push_back( MakeMatch( attr, op, next ) );

    return Filter( Filter::Or, std::move( orlist ) );
  }

  static  auto  GetAttrName( const mtc::zval& z ) -> std::string
  {
    if ( z.get_type() != mtc::zval::z_charstr && z.get_type() != mtc::zval::z_widestr )
      throw std::invalid_argument( "filter attribute name has to be string" );
    return ToString( z );
  }

  // CompileFilter implementation

  auto  CompileFilter( const std::string& attr, const mtc::zval& value ) -> Filter
  {
    if ( attr.empty() )
      throw std::invalid_argument( "filter attribute name must not be empty" );
    return MakeMatch( attr, "=", value );
  }

  auto  CompileFilter( const mtc::zval& criteria ) -> Filter
  {
    auto  op = GetOperator( criteria );

    if ( op == "literal" )
      return Filter( Filter::Literal, {}, Parenthesize( op.GetString() ) );

    if ( op == "mapping" )
    {
      auto  andset = std::vector<Filter>();

      for ( auto& next: op.GetStruct() )
      {
        if ( !next.first.is_charstr() )
          throw std::invalid_argument( "filter attribute name has to be string" );
        andset.push_back( CompileFilter( next.first.to_charstr(), next.second ) );
      }

      if ( andset.size() == 1 )
        return std::move( andset.front() );
      return Filter( Filter::And, std::move( andset ) );
    }

    if ( op == "and" || op == "or" )
    {
      auto  args = op.GetVector();
      auto  list = std::vector<Filter>();

      if ( args.size() < 2 )
        throw std::invalid_argument( mtc::strprintf( "'%s' operator requires arguments", (const char*)op ) );

      for ( auto next = args.begin() + 1; next != args.end(); ++next )
        list.push_back( CompileFilter( *next ) );

      return Filter( op == "and" ? Filter::And : Filter::Or, std::move( list ) );
    }

    if ( op == "not" )
    {
      auto  args = op.GetVector();

      if ( args.size() != 2 )
        throw std::invalid_argument( "'not' operator requires exactly one argument" );

      return Filter( Filter::Not, { CompileFilter( args[1] ) } );
    }

    if ( op == "tuple" )
    {
      auto  args = op.GetVector();

      switch ( args.size() )
      {
        case 1:   return Filter( Filter::Presence, GetAttrName( args[0] ) );
        case 2:   return CompileFilter( GetAttrName( args[0] ), args[1] );
        case 3:   return MakeMatch( GetAttrName( args[0] ), GetAttrName( args[1] ), args[2] );
        default:
          throw std::invalid_argument( "filter tuple has to be [attr], [attr, value] or [attr, op, value]" );
      }
    }

    throw std::logic_error( "unexpected filter operator @" __FILE__ ":" LINE_STRING );
  }

  auto  Conjoin( const Filter& prev, const Filter& next ) -> Filter
  {
    auto  andset = std::vector<Filter>();

    if ( prev.GetType() == Filter::And )
      andset = prev.GetItems();
    else
      andset.push_back( prev );

    andset.push_back( next );

    return Filter( Filter::And, std::move( andset ) );
  }

}}
