# if !defined( __arbor_model_config_hpp__ )
# define __arbor_model_config_hpp__
# include "registry.hpp"
# include <mtc/zmap.h>

namespace arbor {
namespace model {

  auto  MakeCapability( const std::string& name ) -> Capability;

 /*
  * LoadModels( cfg, key )
  *
  * Loads capability declarations from the configuration section:
  *
  *   [
  *     { "name": "person",
  *       "objectClasses": "inetOrgPerson" | [ ... ],
  *       "bases": "ou=people,dc=acme,dc=com" | [ ... ],
  *       "model": "default" },
  *     ...
  *   ]
  *
  * Missing section gives empty models; malformed one throws
  * ConfigurationError.
  */
  auto  LoadModels( const mtc::zmap&, const mtc::zmap::key& ) -> Models;
  auto  LoadModels( const mtc::array_zmap& ) -> Models;
  auto  SaveModels( const Models& ) -> mtc::array_zmap;

}}

# endif   // !__arbor_model_config_hpp__
