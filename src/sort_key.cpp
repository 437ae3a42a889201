#include "sort_key.h"

#include "string_utils.h"

namespace rls {

namespace {

template <typename Projection>
std::shared_ptr<const SortKey> MakeKey(Projection projection)
{
    return std::make_shared<ProjectionKey<Projection>>(std::move(projection));
}

// Prefixes the canonical name tiebreak with the entry's primary attribute.
template <typename Attribute>
std::shared_ptr<const SortKey> AttributeKey(Attribute attribute)
{
    return MakeKey([attribute](const Entry& entry) {
        return std::tuple_cat(std::make_tuple(attribute(entry)), keys::NameOf(entry));
    });
}

}  // namespace

ReversedKey::ReversedKey(std::shared_ptr<const SortKey> key)
    : key_(std::move(key)) {}

bool ReversedKey::Less(const Entry& a, const Entry& b) const
{
    return !key_->Less(a, b);
}

namespace keys {

NameTuple NameOf(const Entry& entry)
{
    return NameTuple{!entry.is_directory(), StringUtils::CaseFold(entry.name()), entry.name()};
}

std::shared_ptr<const SortKey> Name()
{
    return MakeKey([](const Entry& entry) { return NameOf(entry); });
}

std::shared_ptr<const SortKey> CreationTime()
{
    return AttributeKey([](const Entry& entry) { return entry.creation_time(); });
}

std::shared_ptr<const SortKey> ModificationTime()
{
    return AttributeKey([](const Entry& entry) { return entry.modification_time(); });
}

std::shared_ptr<const SortKey> Size()
{
    return AttributeKey([](const Entry& entry) { return entry.size(); });
}

std::shared_ptr<const SortKey> SubfileCount()
{
    return AttributeKey([](const Entry& entry) { return entry.subfile_count(); });
}

std::shared_ptr<const SortKey> SubdirCount()
{
    return AttributeKey([](const Entry& entry) { return entry.subdir_count(); });
}

std::shared_ptr<const SortKey> Extension()
{
    return MakeKey([](const Entry& entry) {
        const std::string extension = entry.extension();
        return std::tuple_cat(std::make_tuple(StringUtils::CaseFold(extension), extension), NameOf(entry));
    });
}

std::shared_ptr<const SortKey> Reverse(std::shared_ptr<const SortKey> key)
{
    return std::make_shared<ReversedKey>(std::move(key));
}

std::shared_ptr<const SortKey> For(SortField field, bool reverse)
{
    std::shared_ptr<const SortKey> key;
    switch (field) {
        case SortField::Name:
            key = Name();
            break;
        case SortField::CreationTime:
            key = CreationTime();
            break;
        case SortField::ModificationTime:
            key = ModificationTime();
            break;
        case SortField::SubfileCount:
            key = SubfileCount();
            break;
        case SortField::SubdirCount:
            key = SubdirCount();
            break;
        case SortField::Size:
            key = Size();
            break;
        case SortField::Extension:
            key = Extension();
            break;
    }
    if (!key) {
        key = Name();
    }
    return reverse ? Reverse(std::move(key)) : key;
}

}  // namespace keys

}  // namespace rls
