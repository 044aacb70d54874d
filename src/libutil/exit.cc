#include "ociauth/util/exit.hh"

namespace ociauth {

Exit::~Exit() {}

} // namespace ociauth
