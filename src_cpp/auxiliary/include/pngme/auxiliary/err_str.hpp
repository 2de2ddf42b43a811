#pragma once

#include <expected>
#include <string>


namespace pngme {

    using ErrStr = std::expected<void, std::string>;

}  // namespace pngme
