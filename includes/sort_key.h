#pragma once

#include <memory>
#include <string>
#include <tuple>
#include <utility>

#include "entry.h"

namespace rls {

enum class SortField {
    Name,
    CreationTime,
    ModificationTime,
    SubfileCount,
    SubdirCount,
    Size,
    Extension,
};

// A total order over entries.
class SortKey {
public:
    virtual ~SortKey() = default;

    // True when `a` is placed before `b`.
    virtual bool Less(const Entry& a, const Entry& b) const = 0;
};

// Orders entries by the lexicographic order of a tuple projected from each.
template <typename Projection>
class ProjectionKey : public SortKey {
public:
    explicit ProjectionKey(Projection projection)
        : projection_(std::move(projection)) {}

    bool Less(const Entry& a, const Entry& b) const override
    {
        return projection_(a) < projection_(b);
    }

private:
    Projection projection_;
};

// Inverts the result of the wrapped comparison, not the compared values, so
// composite tuple orders reverse as a whole.
class ReversedKey : public SortKey {
public:
    explicit ReversedKey(std::shared_ptr<const SortKey> key);

    bool Less(const Entry& a, const Entry& b) const override;

private:
    std::shared_ptr<const SortKey> key_;
};

namespace keys {

// (directories first, case-folded name, exact name). Ends every key so that
// entries never tie.
using NameTuple = std::tuple<bool, std::string, std::string>;
NameTuple NameOf(const Entry& entry);

std::shared_ptr<const SortKey> Name();
std::shared_ptr<const SortKey> CreationTime();
std::shared_ptr<const SortKey> ModificationTime();
std::shared_ptr<const SortKey> Size();
std::shared_ptr<const SortKey> SubfileCount();
std::shared_ptr<const SortKey> SubdirCount();
std::shared_ptr<const SortKey> Extension();

std::shared_ptr<const SortKey> Reverse(std::shared_ptr<const SortKey> key);

std::shared_ptr<const SortKey> For(SortField field, bool reverse = false);

}  // namespace keys

}  // namespace rls
