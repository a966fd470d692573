#include "capture/capture.hpp"

namespace keepsake {

void to_content(Content &out, const QString &value)
{
    out = Content::string(value.toStdString());
}

void to_content(Content &out, const QByteArray &value)
{
    out = Content::bytes(std::vector<std::uint8_t>(value.begin(), value.end()));
}

StructBuilder::StructBuilder(std::string typeName)
    : m_typeName(std::move(typeName))
{
}

Content StructBuilder::build() const
{
    return Content::structure(m_typeName, m_fields);
}

Content MapBuilder::build() const
{
    return Content::map(m_entries);
}

} // namespace keepsake
