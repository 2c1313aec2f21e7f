# include "definitions.hpp"
# include "../../compat.hpp"
# include <mtc/wcsstr.h>
# include <cstring>
# include <cctype>

namespace arbor {
namespace schema {

  struct Token
  {
    enum: unsigned
    {
      Word = 0,
      Quoted = 1,
      Open = 2,
      Close = 3,
      Dollar = 4
    };

    unsigned    type;
    std::string text;
  };

  bool  operator == ( const Token& t, unsigned u )      {  return t.type == u;  }
  bool  operator == ( const Token& t, const char* s )   {  return t.type == Token::Word && strcasecmp( t.text.c_str(), s ) == 0;  }
template <class T>
  bool  operator != ( const Token& t, T x )             {  return !(t == x);  }

  // flag keywords have no value
  static  const char* flagKeywords[] =
  {
    "OBSOLETE",
    "ABSTRACT",
    "STRUCTURAL",
    "AUXILIARY",
    "SINGLE-VALUE",
    "COLLECTIVE",
    "NO-USER-MODIFICATION"
  };

  static  bool  IsFlag( const std::string& keyword )
  {
    for ( auto flag: flagKeywords )
      if ( keyword == flag )
        return true;
    return false;
  }

  static  auto  UpperCase( const std::string& str ) -> std::string
  {
    auto  out = str;

    for ( auto& c: out )
      c = char(toupper( (unsigned char)c ));
    return out;
  }

  static  auto  Unquote( const std::string_view& str ) -> std::string
  {
    auto  output = std::string();

    for ( size_t i = 0; i != str.size(); ++i )
    {
      if ( str[i] == '\\' && i + 2 < str.size() && isxdigit( (unsigned char)str[i + 1] ) && isxdigit( (unsigned char)str[i + 2] ) )
      {
        output += char(std::stoi( std::string( str.substr( i + 1, 2 ) ), nullptr, 16 ));
        i += 2;
      }
        else
      output += str[i];
    }
    return output;
  }

  static  auto  Tokenize( const std::string_view& str ) -> std::vector<Token>
  {
    auto  tokens = std::vector<Token>();
    auto  ptrtop = str.begin();

    while ( ptrtop != str.end() )
    {
      if ( isspace( (unsigned char)*ptrtop ) )
        {  ++ptrtop;  continue;  }

      switch ( *ptrtop )
      {
        case '(':   tokens.push_back( { Token::Open, "(" } );  ++ptrtop;  continue;
        case ')':   tokens.push_back( { Token::Close, ")" } );  ++ptrtop;  continue;
        case '$':   tokens.push_back( { Token::Dollar, "$" } );  ++ptrtop;  continue;
        case '\'':
        {
          auto  ptrend = ++ptrtop;

          while ( ptrend != str.end() && *ptrend != '\'' )
            ++ptrend;
          if ( ptrend == str.end() )
            throw ParseError( mtc::strprintf( "unterminated quoted string in '%s'", std::string( str ).c_str() ) );
          tokens.push_back( { Token::Quoted, Unquote( { &*ptrtop, size_t(ptrend - ptrtop) } ) } );
            ptrtop = ptrend + 1;
          continue;
        }
        default:
        {
          auto  ptrend = ptrtop;

          while ( ptrend != str.end() && !isspace( (unsigned char)*ptrend ) && strchr( "()$'", *ptrend ) == nullptr )
            ++ptrend;
          tokens.push_back( { Token::Word, std::string( ptrtop, ptrend ) } );
            ptrtop = ptrend;
          continue;
        }
      }
    }
    return tokens;
  }

  // Definition implementation

  bool  Definition::Has( const char* key ) const
  {
    return fields.find( key ) != fields.end();
  }

  auto  Definition::Get( const char* key ) const -> std::string
  {
    auto  pfound = fields.find( key );

    return pfound != fields.end() && !pfound->second.empty() ? pfound->second.front() : std::string();
  }

  auto  Definition::List( const char* key ) const -> std::vector<std::string>
  {
    auto  pfound = fields.find( key );

    return pfound != fields.end() ? pfound->second : std::vector<std::string>();
  }

  auto  Definition::Extensions() const -> schema::Extensions
  {
    auto  output = schema::Extensions();

    for ( auto& next: fields )
      if ( next.first.compare( 0, 2, "X-" ) == 0 )
        output.insert( next );

    return output;
  }

 /*
  * ParseDefinition()
  *
  * ( numericoid keyword [value | ( value $ value ... )] ... )
  */
  auto  ParseDefinition( const std::string_view& str ) -> Definition
  {
    auto  tokens = Tokenize( str );
    auto  define = Definition();
    auto  ptrtop = tokens.begin();

    if ( tokens.size() < 3 || tokens.front() != Token::Open || tokens.back() != Token::Close )
      throw ParseError( mtc::strprintf( "definition '%s' has to be enclosed in ()", std::string( str ).c_str() ) );

    if ( (++ptrtop)->type != Token::Word )
      throw ParseError( mtc::strprintf( "numeric OID expected in '%s'", std::string( str ).c_str() ) );

    define.oid = (ptrtop++)->text;

    while ( ptrtop != tokens.end() - 1 )
    {
      if ( ptrtop->type != Token::Word )
        throw ParseError( mtc::strprintf( "keyword expected in '%s'", std::string( str ).c_str() ) );

      auto  keyword = UpperCase( (ptrtop++)->text );
      auto& avalues = define.fields[keyword];

      if ( IsFlag( keyword ) )
        continue;

      if ( ptrtop == tokens.end() - 1 )
        throw ParseError( mtc::strprintf( "value expected for '%s' in '%s'", keyword.c_str(), std::string( str ).c_str() ) );

      if ( *ptrtop == Token::Open )
      {
        for ( ++ptrtop; ptrtop != tokens.end() - 1 && *ptrtop != Token::Close; ++ptrtop )
          if ( *ptrtop != Token::Dollar )
            avalues.push_back( ptrtop->text );

        if ( ptrtop == tokens.end() - 1 )
          throw ParseError( mtc::strprintf( "')' expected for '%s' in '%s'", keyword.c_str(), std::string( str ).c_str() ) );
        ++ptrtop;
      }
        else
      if ( *ptrtop == Token::Close || *ptrtop == Token::Dollar )
        throw ParseError( mtc::strprintf( "unexpected '%s' in '%s'", ptrtop->text.c_str(), std::string( str ).c_str() ) );
        else
      avalues.push_back( (ptrtop++)->text );
    }

    return define;
  }

}}
