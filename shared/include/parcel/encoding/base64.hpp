#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace parcel::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // std::nullopt when the input is not valid standard (padded) base64.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace parcel::encoding
