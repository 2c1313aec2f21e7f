# if !defined( __arbor_model_capability_hpp__ )
# define __arbor_model_capability_hpp__
# include <mtc/interfaces.h>
# include <string>

namespace arbor {
namespace model {

 /*
  * ICapability
  *
  * Optional behaviour module applied to the branches matching the declared
  * object classes and/or bases.
  */
  struct ICapability: mtc::Iface
  {
    virtual auto  GetName() const -> std::string = 0;
  };

}}

# endif   // !__arbor_model_capability_hpp__
