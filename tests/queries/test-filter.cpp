# include "../../queries/filter.hpp"
# include <mtc/test-it-easy.hpp>

using namespace arbor;
using namespace arbor::queries;

static  auto  Compile( const mtc::zval& criteria ) -> std::string
{
  return CompileFilter( criteria ).to_string();
}

TestItEasy::RegisterFunc  test_filter( []()
{
  TEST_CASE( "queries/Filter" )
  {
    SECTION( "default filter matches any entry" )
    {
      REQUIRE( Filter().GetType() == Filter::Presence );
      REQUIRE( Filter().to_string() == "(objectClass=*)" );
    }
    SECTION( "simple filters are serialized with operator tokens" )
    {
      REQUIRE( Filter( Filter::Equality, "sn", "Granger" ).to_string() == "(sn=Granger)" );
      REQUIRE( Filter( Filter::Presence, "mail" ).to_string() == "(mail=*)" );
      REQUIRE( Filter( Filter::GreaterOrEqual, "uidNumber", "1000" ).to_string() == "(uidNumber>=1000)" );
      REQUIRE( Filter( Filter::LessOrEqual, "uidNumber", "2000" ).to_string() == "(uidNumber<=2000)" );
      REQUIRE( Filter( Filter::Approx, "cn", "Hermione" ).to_string() == "(cn~=Hermione)" );
      REQUIRE( Filter( Filter::Substring, "cn", "Her*one" ).to_string() == "(cn=Her*one)" );
    }
    SECTION( "special characters in values are escaped" )
    {
      REQUIRE( Filter( Filter::Equality, "cn", "a*(b)\\c" ).to_string() == "(cn=a\\2a\\28b\\29\\5cc)" );
      REQUIRE( EscapeFilterValue( "x*y", true ) == "x*y" );
      REQUIRE( EscapeFilterValue( std::string( "a\0b", 3 ) ) == "a\\00b" );
    }
    SECTION( "compound filters are fully parenthesized" )
    {
      auto  filter = Filter( Filter::Or, {
        Filter( Filter::Equality, "uid", "a" ),
        Filter( Filter::Not, { Filter( Filter::Presence, "mail" ) } ) } );

      REQUIRE( filter.to_string() == "(|(uid=a)(!(mail=*)))" );
      REQUIRE( filter.GetItems().size() == 2 );
    }
    SECTION( "invalid filters are not constructed" )
    {
      REQUIRE_EXCEPTION( Filter( Filter::Equality, "" ), std::invalid_argument );
      REQUIRE_EXCEPTION( Filter( Filter::And, "cn" ), std::logic_error );
      REQUIRE_EXCEPTION( Filter( Filter::And, std::vector<Filter>() ), std::invalid_argument );
      REQUIRE_EXCEPTION( Filter( Filter::Not, { Filter(), Filter() } ), std::invalid_argument );
    }
    SECTION( "filters are compared by structure" )
    {
      REQUIRE( Filter( Filter::Equality, "cn", "x" ) == Filter( Filter::Equality, "cn", "x" ) );
      REQUIRE( Filter( Filter::Equality, "cn", "x" ) != Filter( Filter::Approx, "cn", "x" ) );
    }
  }
  TEST_CASE( "queries/CompileFilter" )
  {
    SECTION( "string criteria are passed as literal filters" )
    {
      REQUIRE( Compile( "(cn=*Granger*)" ) == "(cn=*Granger*)" );
      REQUIRE( Compile( " cn=x " ) == "(cn=x)" );
      REQUIRE( CompileFilter( "(cn=x)" ).GetType() == Filter::Literal );
      REQUIRE_EXCEPTION( CompileFilter( "  " ), std::invalid_argument );
    }
    SECTION( "single pair mapping compiles to equality" )
    {
      auto  filter = CompileFilter( mtc::zmap{ { "sn", "Granger" } } );

      REQUIRE( filter.GetType() == Filter::Equality );
      REQUIRE( filter.to_string() == "(sn=Granger)" );
    }
    SECTION( "mapping of several pairs compiles to conjunction in key order" )
    {
      REQUIRE( Compile( mtc::zmap{
        { "givenName", "Michael" },
        { "sn", "Granger" } } ) == "(&(givenName=Michael)(sn=Granger))" );
    }
    SECTION( "multiple values compile to disjunction in value order" )
    {
      REQUIRE( Compile( mtc::zmap{
        { "uid", mtc::array_charstr{ "a", "b", "c" } } } ) == "(|(uid=a)(uid=b)(uid=c))" );
      REQUIRE( Compile( mtc::zmap{
        { "objectClass", "device" },
        { "cn", mtc::array_zval{ "x", "y" } } } ) == "(&(|(cn=x)(cn=y))(objectClass=device))" );
    }
    SECTION( "wildcards in mapping values give presence and substring filters" )
    {
      REQUIRE( CompileFilter( mtc::zmap{ { "mail", "*" } } ).GetType() == Filter::Presence );
      REQUIRE( CompileFilter( mtc::zmap{ { "cn", "Her*" } } ).GetType() == Filter::Substring );
      REQUIRE( Compile( mtc::zmap{ { "cn", "Her*" } } ) == "(cn=Her*)" );
    }
    SECTION( "numeric values are converted to strings" )
    {
      REQUIRE( Compile( mtc::zmap{ { "uidNumber", 1001 } } ) == "(uidNumber=1001)" );
    }
    SECTION( "operator sequences compile recursively" )
    {
      REQUIRE( Compile( mtc::array_zval{ "not", mtc::array_zval{ "and",
        mtc::array_zval{ "sn", "Granger" },
        mtc::array_zval{ "sn", "Smith" } } } ) == "(!(&(sn=Granger)(sn=Smith)))" );
      REQUIRE( Compile( mtc::array_zval{ "or",
        mtc::zmap{ { "sn", "Granger" } },
        "(uid=hgranger)" } ) == "(|(sn=Granger)(uid=hgranger))" );
      REQUIRE( Compile( mtc::array_zval{ "&",
        mtc::array_zval{ "mail" },
        mtc::array_zval{ "!", mtc::array_zval{ "cn", "x" } } } ) == "(&(mail=*)(!(cn=x)))" );
      REQUIRE( Compile( mtc::array_zval{ "AND", "(a=1)", "(b=2)" } ) == "(&(a=1)(b=2))" );
    }
    SECTION( "tuples compile to matches" )
    {
      REQUIRE( Compile( mtc::array_charstr{ "mail" } ) == "(mail=*)" );
      REQUIRE( Compile( mtc::array_charstr{ "sn", "Granger" } ) == "(sn=Granger)" );
      REQUIRE( Compile( mtc::array_charstr{ "uidNumber", ">=", "1000" } ) == "(uidNumber>=1000)" );
      REQUIRE( Compile( mtc::array_charstr{ "uidNumber", "<=", "2000" } ) == "(uidNumber<=2000)" );
      REQUIRE( Compile( mtc::array_charstr{ "cn", "~=", "Hermione" } ) == "(cn~=Hermione)" );
      REQUIRE( Compile( mtc::array_charstr{ "cn", "!=", "x" } ) == "(!(cn=x))" );
      REQUIRE( Compile( mtc::array_zval{ "uid", mtc::array_charstr{ "a", "b" } } ) == "(|(uid=a)(uid=b))" );
    }
    SECTION( "malformed criteria throw invalid_argument" )
    {
      REQUIRE_EXCEPTION( CompileFilter( mtc::zval() ), std::invalid_argument );
      REQUIRE_EXCEPTION( CompileFilter( mtc::zmap() ), std::invalid_argument );
      REQUIRE_EXCEPTION( CompileFilter( mtc::array_zval() ), std::invalid_argument );
      REQUIRE_EXCEPTION( CompileFilter( mtc::array_zval{ "and" } ), std::invalid_argument );
      REQUIRE_EXCEPTION( CompileFilter( mtc::array_zval{ "not", "(a=1)", "(b=2)" } ), std::invalid_argument );
      REQUIRE_EXCEPTION( CompileFilter( mtc::array_charstr{ "cn", "<>", "x" } ), std::invalid_argument );
      REQUIRE_EXCEPTION( CompileFilter( mtc::array_charstr{ "a", "=", "b", "c" } ), std::invalid_argument );
      REQUIRE_EXCEPTION( CompileFilter( mtc::zmap{ { "cn", mtc::zmap{ { "x", "y" } } } } ), std::invalid_argument );
      REQUIRE_EXCEPTION( CompileFilter( mtc::zmap{ { "cn", mtc::array_charstr() } } ), std::invalid_argument );
      REQUIRE_EXCEPTION( CompileFilter( "", mtc::zval( "x" ) ), std::invalid_argument );
    }
  }
  TEST_CASE( "queries/Conjoin" )
  {
    auto  first = Conjoin( Filter(), Filter( Filter::Equality, "sn", "Granger" ) );
    auto  second = Conjoin( first, CompileFilter( "(mail=*)" ) );

    REQUIRE( first.to_string() == "(&(objectClass=*)(sn=Granger))" );
    REQUIRE( second.to_string() == "(&(objectClass=*)(sn=Granger)(mail=*))" );
    REQUIRE( second.GetItems().size() == 3 );
    REQUIRE( first.GetItems().size() == 2 );

    SECTION( "disjunction on the left is kept as one item" )
    {
      auto  either = CompileFilter( mtc::zmap{ { "uid", mtc::array_charstr{ "a", "b" } } } );

      REQUIRE( Conjoin( either, Filter() ).to_string() == "(&(|(uid=a)(uid=b))(objectClass=*))" );
    }
  }
} );
