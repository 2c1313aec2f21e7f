# include "query-tools.hpp"
# include "../value-tools.hpp"
# include "../../compat.hpp"
# include <stdexcept>

namespace arbor {
namespace queries {

  // Operator implementation

  Operator::Operator( const std::string& cmd, const mtc::zval& var ):
    command( cmd ),
    zparams( var )  {}

  auto  Operator::GetVector() const -> mtc::array_zval
  {
    switch ( zparams.get_type() )
    {
      case mtc::zval::z_array_zval:
        return *zparams.get_array_zval();
      case mtc::zval::z_array_charstr:
      {
        auto  output = mtc::array_zval();

        for ( auto& next: *zparams.get_array_charstr() )
          output.emplace_back( next );
        return output;
      }
      default:
        throw std::invalid_argument( "operator value has to point to array" );
    }
  }

  auto  Operator::GetString() const -> std::string
  {
    if ( zparams.get_type() == mtc::zval::z_charstr || zparams.get_type() == mtc::zval::z_widestr )
      return ToString( zparams );
    throw std::invalid_argument( "operator has to handle string" );
  }

  auto  Operator::GetStruct() const -> const mtc::zmap&
  {
    if ( zparams.get_type() != mtc::zval::z_zmap )
      throw std::invalid_argument( "operator value has to point to structure" );
    return *zparams.get_zmap();
  }

  Operator::operator const char *() const
  {
    return command.c_str();
  }

  bool  Operator::operator == ( const char* str ) const
  {
    return command == str;
  }

  //

  static  auto  GetCommand( const mtc::zval& head ) -> const char*
  {
    if ( head.get_type() != mtc::zval::z_charstr && head.get_type() != mtc::zval::z_widestr )
      return "tuple";

    auto  str = ToString( head );

    if ( strcasecmp( str.c_str(), "and" ) == 0 || str == "&" )  return "and";
    if ( strcasecmp( str.c_str(), "or" ) == 0 || str == "|" )   return "or";
    if ( strcasecmp( str.c_str(), "not" ) == 0 || str == "!" )  return "not";
    return "tuple";
  }

  Operator  GetOperator( const mtc::zval& query )
  {
    switch ( query.get_type() )
    {
      case mtc::zval::z_charstr:
      case mtc::zval::z_widestr:
        return { "literal", query };
      case mtc::zval::z_zmap:
        if ( query.get_zmap()->empty() )
          throw std::invalid_argument( "invalid (empty) filter criteria passed" );
        return { "mapping", query };
      case mtc::zval::z_array_charstr:
        if ( query.get_array_charstr()->empty() )
          throw std::invalid_argument( "invalid (empty) filter criteria passed" );
        return { GetCommand( mtc::zval( query.get_array_charstr()->front() ) ), query };
      case mtc::zval::z_array_zval:
        if ( query.get_array_zval()->empty() )
          throw std::invalid_argument( "invalid (empty) filter criteria passed" );
        return { GetCommand( query.get_array_zval()->front() ), query };
      default:
        throw std::invalid_argument( "invalid filter criteria type" );
    }
  }

}}
