# if !defined( __arbor_branch_hpp__ )
# define __arbor_branch_hpp__
# include "model/capability.hpp"
# include "directory.hpp"
# include "dn.hpp"
# include <optional>
# include <map>

namespace arbor {

  namespace queries {  class Branchset;  }

  class Branch;

 /*
  * IBranchClass
  *
  * Type tag for the branches produced by searches: names the branch type and
  * decorates each found branch before it is passed to the caller.
  */
  struct IBranchClass: mtc::Iface
  {
    virtual auto  GetName() const -> std::string = 0;
    virtual void  Prepare( Branch& ) const = 0;
  };

 /*
  * Branch
  *
  * Directory entry bound to a DN. The raw entry is fetched on first access
  * and attribute values are decoded with the directory schema on demand.
  *
  * Pointers returned by Get() stay valid until the next modification of
  * the branch.
  */
  class Branch
  {
  public:
    using Mixins = std::vector<mtc::api<const model::ICapability>>;

  public:
    Branch( const Directory&, const std::string& dn );      // throws InvalidDN
    Branch( const Directory&, const mtc::zmap& entry );     // throws InvalidDN

  public:     // identity
    auto  GetDirectory() const -> const Directory&  {  return directory;  }
    auto  GetDn() const -> const std::string&  {  return distName;  }
    auto  GetRdn() const -> std::string;
    auto  GetRdnPairs() const -> dn::RDN;
    auto  GetParentDn() const -> std::string;
    auto  SplitDn( unsigned limit = 0 ) const -> std::vector<std::string>;

    auto  GetParent() const -> Branch;
    auto  GetChildren() const -> std::vector<Branch>;

   /*
    * Child( attr, value, extra )
    *
    * Creates the branch for attr=value[+extra...],dn without touching the
    * directory; throws UnknownAttribute if the schema does not describe
    * one of the attributes.
    */
    auto  Child( const std::string& attr, const std::string& value, const mtc::zmap& extra = {} ) const -> Branch;

    auto  SetRdn( const std::string& ) -> Branch&;
    auto  SetDn( const std::string& ) -> Branch&;

  public:     // entry
    auto  GetEntry() const -> const mtc::zmap&;             // throws NotFound
    bool  Exists() const;
    auto  IncludeOperational( bool ) -> Branch&;
    bool  IncludesOperational() const  {  return operational;  }
    void  Clear();

  public:     // attribute values
    auto  Get( const std::string_view& ) const -> const mtc::zval*;
    auto  GetValues( const std::string_view& ) const -> std::vector<std::string>;
    auto  operator []( const std::string_view& attr ) const -> const mtc::zval*  {  return Get( attr );  }

    void  Set( const std::string& attr, const mtc::zval& );
    void  Merge( const mtc::zmap& );
    void  Delete();
    void  Delete( const mtc::zmap& );
    void  Delete( const std::vector<std::string>& );
    void  Create( const mtc::zmap& = {} );
    auto  Copy( const std::string& newDn, const mtc::zmap& = {} ) const -> Branch;
    auto  Move( const std::string& newRdn, const mtc::zmap& = {} ) -> Branch&;

  public:     // schema
    using ObjectClasses = std::vector<const schema::ObjectClass*>;
    using AttributeTypes = std::vector<const schema::AttributeType*>;

    auto  GetObjectClasses( const std::vector<std::string>& extra = {} ) const -> ObjectClasses;
    auto  GetMustAttributeTypes( const std::vector<std::string>& extra = {} ) const -> AttributeTypes;
    auto  GetMayAttributeTypes( const std::vector<std::string>& extra = {} ) const -> AttributeTypes;
    auto  GetValidAttributeTypes( const std::vector<std::string>& extra = {} ) const -> AttributeTypes;
    auto  GetMustOids( const std::vector<std::string>& extra = {} ) const -> std::vector<std::string>;
    auto  GetMayOids( const std::vector<std::string>& extra = {} ) const -> std::vector<std::string>;
    auto  GetValidAttributeOids( const std::vector<std::string>& extra = {} ) const -> std::vector<std::string>;
    auto  GetMustAttributes( const std::vector<std::string>& extra = {} ) const -> mtc::zmap;
    auto  GetMayAttributes( const std::vector<std::string>& extra = {} ) const -> mtc::zmap;
    bool  IsValidAttribute( const std::string_view& ) const;

  public:     // queries
    auto  GetBranchset() const -> queries::Branchset;
    auto  Filter( const mtc::zval& ) const -> queries::Branchset;
    auto  Scope( unsigned ) const -> queries::Branchset;
    auto  Scope( const std::string& ) const -> queries::Branchset;
    auto  Select( const std::vector<std::string>& ) const -> queries::Branchset;

  public:     // type and ordering
    auto  GetTypeName() const -> std::string;
    auto  GetBranchClass() const -> mtc::api<const IBranchClass>  {  return branchClass;  }
    auto  SetBranchClass( mtc::api<const IBranchClass> ) -> Branch&;
    auto  GetMixins() const -> const Mixins&  {  return mixins;  }
    auto  SetMixins( Mixins ) -> Branch&;
    bool  HasMixin( const std::string_view& ) const;

   /*
    * Compare()
    *
    * Compares the DNs of the branches from the least significant component;
    * ancestors precede descendants. Branches of different types are not
    * comparable.
    */
    auto  Compare( const Branch& ) const -> std::optional<int>;

    bool  operator == ( const Branch& ) const;
    bool  operator != ( const Branch& b ) const {  return !(*this == b);  }

  protected:
    auto  GetSchemaAttributes( const AttributeTypes& ) const -> mtc::zmap;

  protected:
    Directory                         directory;
    std::string                       distName;
    bool                              operational = false;
    mtc::api<const IBranchClass>      branchClass;
    Mixins                            mixins;

    mutable std::optional<mtc::zmap>        rawEntry;
    mutable std::map<std::string, mtc::zval> decoded;

  };

}

# endif   // !__arbor_branch_hpp__
