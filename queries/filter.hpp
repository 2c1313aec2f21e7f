# if !defined( __arbor_queries_filter_hpp__ )
# define __arbor_queries_filter_hpp__
# include <mtc/zmap.h>
# include <string>
# include <vector>

namespace arbor {
namespace queries {

 /*
  * Filter
  *
  * Compiled search filter tree. Default-constructed filter matches any
  * entry: (objectClass=*).
  */
  class Filter
  {
  public:
    enum: unsigned
    {
      Literal = 0,
      Presence = 1,
      Equality = 2,
      Substring = 3,
      GreaterOrEqual = 4,
      LessOrEqual = 5,
      Approx = 6,
      And = 7,
      Or = 8,
      Not = 9
    };

  public:
    Filter();
    Filter( unsigned op, const std::string& attr, const std::string& value = {} );
    Filter( unsigned op, std::vector<Filter>&& );
    Filter( const Filter& ) = default;
    Filter( Filter&& ) = default;
    Filter& operator = ( const Filter& ) = default;
    Filter& operator = ( Filter&& ) = default;

  public:
    auto  GetType() const -> unsigned                   {  return opcode;  }
    auto  GetAttribute() const -> const std::string&    {  return attribute;  }
    auto  GetValue() const -> const std::string&        {  return argument;  }
    auto  GetItems() const -> const std::vector<Filter>&  {  return subitems;  }

    auto  to_string() const -> std::string;

    bool  operator == ( const Filter& ) const;
    bool  operator != ( const Filter& f ) const {  return !(*this == f);  }

  protected:
    unsigned            opcode;
    std::string         attribute;
    std::string         argument;
    std::vector<Filter> subitems;

  };

 /*
  * CompileFilter( criteria )
  *
  * Compiles structured criteria into the filter tree:
  *   "(cn=x)" or "cn=x"            - literal filter, parenthesized if needed;
  *   { attr: value, ... }          - equality for each pair, AND-ed together
  *                                   in key order; array value gives OR of
  *                                   equalities, "*" gives presence, value
  *                                   with '*' gives substring match;
  *   [ "and"|"&", x, y, ... ]      - conjunction of compiled arguments;
  *   [ "or"|"|", x, y, ... ]       - disjunction of compiled arguments;
  *   [ "not"|"!", x ]              - negation;
  *   [ attr ]                      - presence;
  *   [ attr, value ]               - equality;
  *   [ attr, op, value ]           - comparison, op is one of = ~= >= <= !=
  *
  * Throws std::invalid_argument for empty or malformed criteria.
  */
  auto  CompileFilter( const mtc::zval& ) -> Filter;
  auto  CompileFilter( const std::string& attr, const mtc::zval& value ) -> Filter;

 /*
  * Conjoin( previous, next )
  *
  * Returns AND of the filters; conjunction on the left side is extended
  * with the new item instead of nesting.
  */
  auto  Conjoin( const Filter&, const Filter& ) -> Filter;

  auto  EscapeFilterValue( const std::string&, bool keepStars = false ) -> std::string;

}}

# endif   // !__arbor_queries_filter_hpp__
