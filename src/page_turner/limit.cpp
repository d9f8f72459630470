#include <page_turner/limit.hpp>
//

namespace page_turner {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const NoLimit&)
{
  return out << "NoLimit{}";
}

}  // namespace page_turner
