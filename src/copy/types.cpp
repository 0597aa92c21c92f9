#include "dcp/copy/types.hpp"

namespace dcp::copy {

CopyAttributes::CopyAttributes(std::initializer_list<FileAttribute> attributes) {
    for (auto attribute : attributes) {
        add(attribute);
    }
}

dcp::Result<CopyAttributes> CopyAttributes::parse(const std::string& letters) {
    CopyAttributes attributes;
    for (char letter : letters) {
        switch (letter) {
            case 'r':
            case 'R':
                attributes.add(FileAttribute::Replication);
                break;
            case 'b':
            case 'B':
                attributes.add(FileAttribute::BlockSize);
                break;
            default:
                return dcp::Err<CopyAttributes>(std::string("Unknown preserve attribute '") + letter + "'");
        }
    }
    return dcp::Ok(attributes);
}

CopyAttributes& CopyAttributes::add(FileAttribute attribute) noexcept {
    bits_ |= static_cast<std::uint8_t>(attribute);
    return *this;
}

std::string CopyAttributes::to_string() const {
    std::string letters;
    if (contains(FileAttribute::Replication)) {
        letters += 'r';
    }
    if (contains(FileAttribute::BlockSize)) {
        letters += 'b';
    }
    return letters;
}

} // namespace dcp::copy
