# if !defined( __arbor_queries_hpp__ )
# define __arbor_queries_hpp__
# include "queries/filter.hpp"
# include "branch.hpp"
# include <initializer_list>
# include <functional>
# include <optional>
# include <memory>
# include <map>

namespace arbor {
namespace queries {

  class BranchCollection;

 /*
  * Branchset
  *
  * Immutable search description: base branch, filter, scope, selected
  * attributes, limit, timeout, branch class and control options. Every
  * modifier returns the new branchset leaving the source one untouched.
  *
  * Each enumeration runs exactly one search; the order of results is the
  * order the directory returns them in.
  */
  class Branchset
  {
  public:
    using Receiver = std::function<void( const Branch& )>;

  public:
    Branchset( const Branch&, const queries::Filter& = queries::Filter() );

  public:     // modifiers
    auto  Filter( const mtc::zval& ) const -> Branchset;            // throws invalid_argument
    auto  Filter( const queries::Filter& ) const -> Branchset;
    auto  Scope( unsigned ) const -> Branchset;
    auto  Scope( const std::string& ) const -> Branchset;
    auto  Select( const std::vector<std::string>& ) const -> Branchset;
    auto  SelectAll() const -> Branchset;
    auto  SelectMore( const std::vector<std::string>& ) const -> Branchset;
    auto  Limit( unsigned ) const -> Branchset;
    auto  WithoutLimit() const -> Branchset;
    auto  Timeout( double ) const -> Branchset;
    auto  WithoutTimeout() const -> Branchset;
    auto  As( mtc::api<const IBranchClass> ) const -> Branchset;

   /*
    * With( key, value )
    *
    * Sets the option passed to the registered controls; registered controls
    * use it to build their payloads.
    */
    auto  With( const std::string& key, const mtc::zval& ) const -> Branchset;

  public:     // properties
    auto  GetBase() const -> const Branch&  {  return *base;  }
    auto  GetBaseDn() const -> const std::string&  {  return base->GetDn();  }
    auto  GetDirectory() const -> const Directory&  {  return base->GetDirectory();  }
    auto  GetFilter() const -> const queries::Filter&  {  return filter;  }
    auto  GetFilterString() const -> std::string  {  return filter.to_string();  }
    auto  GetScope() const -> unsigned  {  return scope;  }
    auto  GetScopeName() const -> std::string;
    auto  GetSelect() const -> const std::vector<std::string>&  {  return select;  }
    auto  GetLimit() const -> unsigned  {  return limit;  }
    auto  GetTimeout() const -> double  {  return timeout;  }
    auto  GetBranchClass() const -> mtc::api<const IBranchClass>  {  return branchClass;  }
    auto  GetOptions() const -> const mtc::zmap&  {  return options;  }
    auto  GetSearchParams() const -> SearchParams;

    auto  to_string() const -> std::string;

  public:     // enumeration
    void  Each( const Receiver& ) const;
    auto  All() const -> std::vector<Branch>;
    auto  First() const -> std::optional<Branch>;
    bool  Empty() const;
    auto  Map( const std::string& attr ) const -> std::vector<mtc::zval>;
    auto  ToHash( const std::string& keyAttr ) const -> std::map<std::string, mtc::zmap>;
    auto  ToHash( const std::string& keyAttr, const std::string& valueAttr ) const -> std::map<std::string, mtc::zval>;

    auto  Combine( const Branchset& ) const -> BranchCollection;
    auto  Combine( const Branch& ) const -> BranchCollection;

  protected:
    void  Search( const SearchParams&, const Receiver& ) const;

  protected:
    std::shared_ptr<const Branch> base;
    queries::Filter               filter;
    unsigned                      scope;
    std::string                   scopeName;      // keeps unrecognized scope
    std::vector<std::string>      select;
    unsigned                      limit = 0;
    double                        timeout = 0;
    mtc::api<const IBranchClass>  branchClass;
    mtc::zmap                     options;

  };

 /*
  * BranchCollection
  *
  * Union of branchsets enumerated one after another. Modifiers apply to
  * every member; the limit is applied to each member search separately.
  */
  class BranchCollection
  {
  public:
    using Receiver = Branchset::Receiver;

  public:
    BranchCollection() = default;
    BranchCollection( std::vector<Branchset> );
    BranchCollection( std::initializer_list<Branchset> );

  public:     // modifiers
    auto  Filter( const mtc::zval& ) const -> BranchCollection;
    auto  Scope( unsigned ) const -> BranchCollection;
    auto  Scope( const std::string& ) const -> BranchCollection;
    auto  Select( const std::vector<std::string>& ) const -> BranchCollection;
    auto  SelectAll() const -> BranchCollection;
    auto  SelectMore( const std::vector<std::string>& ) const -> BranchCollection;
    auto  Limit( unsigned ) const -> BranchCollection;
    auto  WithoutLimit() const -> BranchCollection;
    auto  Timeout( double ) const -> BranchCollection;
    auto  WithoutTimeout() const -> BranchCollection;
    auto  As( mtc::api<const IBranchClass> ) const -> BranchCollection;

  public:     // properties
    auto  GetBranchsets() const -> const std::vector<Branchset>&  {  return branchsets;  }
    auto  GetBaseDns() const -> std::vector<std::string>;
    auto  size() const -> size_t  {  return branchsets.size();  }
    bool  empty() const  {  return branchsets.empty();  }

  public:     // enumeration
    void  Each( const Receiver& ) const;
    auto  All() const -> std::vector<Branch>;
    auto  First() const -> std::optional<Branch>;
    bool  Empty() const;
    auto  Map( const std::string& attr ) const -> std::vector<mtc::zval>;
    auto  ToHash( const std::string& keyAttr ) const -> std::map<std::string, mtc::zmap>;
    auto  ToHash( const std::string& keyAttr, const std::string& valueAttr ) const -> std::map<std::string, mtc::zval>;

    auto  Combine( const Branchset& ) const -> BranchCollection;
    auto  Combine( const Branch& ) const -> BranchCollection;
    auto  Combine( const BranchCollection& ) const -> BranchCollection;

  protected:
  template <class Modify>
    auto  Transform( Modify ) const -> BranchCollection;

  protected:
    std::vector<Branchset>  branchsets;

  };

}}

# endif   // !__arbor_queries_hpp__
