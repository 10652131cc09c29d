#include "core/Config.hpp"

namespace cfg {

KeyConfig keys{};

} // namespace cfg
