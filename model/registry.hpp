# if !defined( __arbor_model_registry_hpp__ )
# define __arbor_model_registry_hpp__
# include "capability.hpp"
# include "../queries.hpp"
# include <variant>
# include <memory>
# include <map>

namespace arbor {
namespace model {

  using Capability = mtc::api<const ICapability>;
  using Capabilities = std::vector<Capability>;
  using SearchResult = std::variant<queries::Branchset, queries::BranchCollection>;

  struct Declaration
  {
    std::vector<std::string>  objectClasses;
    std::vector<std::string>  bases;              // normalized DNs
  };

 /*
  * Registry
  *
  * Capabilities of one model class indexed by the declared object classes
  * and by the declared bases. Registry is a shared handle: copies refer to
  * the same registrations.
  */
  class Registry
  {
    struct impl;

    std::shared_ptr<impl> data;

  public:
    Registry( const std::string& modelClass = "default" );

    auto  GetName() const -> const std::string&;

   /*
    * Register()
    *
    * Adds the capability with the object classes and bases, or extends the
    * declaration of the capability already registered. Bases are normalized;
    * invalid base DNs throw InvalidDN.
    */
    void  Register( const Capability&,
      const std::vector<std::string>& objectClasses,
      const std::vector<std::string>& bases = {} );
    bool  Remove( const Capability& );

    auto  GetDeclaration( const Capability& ) const -> const Declaration*;
    auto  GetCapabilities() const -> Capabilities;
    auto  Find( const std::string_view& name ) const -> Capability;

   /*
    * MixinsForObjectClasses( classes )
    *
    * Capabilities whose non-empty set of object classes is the subset of
    * the passed ones.
    */
    auto  MixinsForObjectClasses( const std::vector<std::string>& ) const -> Capabilities;

   /*
    * MixinsForDn( dn )
    *
    * Capabilities with at least one base being the dn or one of its
    * ancestors.
    */
    auto  MixinsForDn( const std::string_view& ) const -> Capabilities;
    auto  MixinsFor( const Branch& ) const -> Capabilities;

   /*
    * SetDirectory( directory )
    *
    * Binds the model class to the directory used by the Search() and
    * Instantiate() calls without the explicit one. GetDirectory() throws
    * ConfigurationError if none was set.
    */
    auto  SetDirectory( const Directory& ) -> Registry&;
    auto  GetDirectory() const -> const Directory&;

   /*
    * Search( capability, directory )
    *
    * Builds the search for all the entries the capability applies to:
    * the branchset for the single base (the directory base if none declared)
    * or the collection of branchsets for multiple bases.
    *
    * Throws ConfigurationError if the capability has neither object classes
    * nor bases.
    */
    auto  Search( const Capability& ) const -> SearchResult;
    auto  Search( const Capability&, const Directory& ) const -> SearchResult;

   /*
    * Instantiate( capability, directory, dn, attributes )
    *
    * Creates the not yet stored branch at dn; objectClass values are the
    * declared ones merged with the passed ones, RDN values are added to the
    * attributes unless present.
    */
    auto  Instantiate( const Capability&, const Directory&, const std::string& dn,
      const mtc::zmap& attributes = {} ) const -> Branch;
    auto  Instantiate( const Capability&, const std::string& dn,
      const mtc::zmap& attributes = {} ) const -> Branch;

    auto  AsClass() const -> mtc::api<const IBranchClass>;

  };

 /*
  * Models
  *
  * Registries by model class name. A capability belongs to one model class
  * at a time; declaring it for another class moves its registration.
  */
  class Models
  {
  public:
    auto  Get( const std::string& modelClass = "default" ) -> Registry&;
    auto  Find( const std::string& modelClass ) const -> const Registry*;
    auto  List() const -> std::vector<std::string>;

    void  Declare( const Capability&,
      const std::vector<std::string>& objectClasses,
      const std::vector<std::string>& bases = {},
      const std::string& modelClass = "default" );
    void  SetModelClass( const Capability&, const std::string& modelClass );
    auto  GetModelClass( const Capability& ) const -> std::string;
    bool  Remove( const Capability& );

  protected:
    std::map<std::string, Registry> registries;

  };

}}

# endif   // !__arbor_model_registry_hpp__
