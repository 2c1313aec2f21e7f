# if !defined( __arbor_src_queries_query_tools_hpp__ )
# define __arbor_src_queries_query_tools_hpp__
# include <mtc/zmap.h>

namespace arbor {
namespace queries {

 /*
  * Operator
  *
  * Classifies one node of structured filter criteria:
  *   "literal" - pre-formed filter string;
  *   "mapping" - attribute -> value(s) structure;
  *   "and", "or", "not" - operator sequence, arguments follow the operator;
  *   "tuple" - [attr], [attr, value] or [attr, op, value] array.
  */
  class Operator
  {
    std::string       command;
    const mtc::zval&  zparams;

  public:
    Operator( const std::string&, const mtc::zval& );
    Operator( const Operator& ) = default;

    auto  GetVector() const -> mtc::array_zval;
    auto  GetString() const -> std::string;
    auto  GetStruct() const -> const mtc::zmap&;

    operator const char*() const;
  template <class T>
    bool  operator != ( T t ) const {  return !(*this == t);  }
    bool  operator == ( const char* ) const;
  };

  Operator  GetOperator( const mtc::zval& );

}}

# endif   // !__arbor_src_queries_query_tools_hpp__
