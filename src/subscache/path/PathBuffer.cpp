#include "path/PathBuffer.hpp"

#include "log/TaggedLogger.hpp"

#include <new>
#include <optional>
#include <string>
#include <utility>

namespace {

using SC::Error;
using SC::Expected;
using SC::Limits;
using SC::PathOptions;
using SC::PathStorage;
using SC::Subscript;
using SC::SubscriptBatch;

auto heap() noexcept -> std::pmr::memory_resource* {
    return std::pmr::new_delete_resource();
}

auto make_storage(std::pmr::memory_resource* resource,
                  std::string_view varname,
                  PathStorage::Shape const& shape,
                  PathOptions const& options) -> std::shared_ptr<PathStorage> {
    return std::allocate_shared<PathStorage>(std::pmr::polymorphic_allocator<PathStorage>{resource},
                                             varname,
                                             shape,
                                             options,
                                             resource);
}

auto check_varname(std::string_view varname, Limits const& limits) -> std::optional<Error> {
    if (varname.empty()) {
        return Error{Error::Code::InvalidVarname, "Varname must not be empty"};
    }
    if (varname.size() > limits.maxVarnameLength) {
        return Error{Error::Code::InvalidVarname,
                     "Varname of " + std::to_string(varname.size()) + " bytes exceeds the limit of "
                         + std::to_string(limits.maxVarnameLength)};
    }
    return std::nullopt;
}

auto check_depth(std::size_t depth, Limits const& limits) -> std::optional<Error> {
    if (depth > limits.maxSubscripts) {
        return Error{Error::Code::TooManySubscripts,
                     "Depth " + std::to_string(depth) + " exceeds the limit of "
                         + std::to_string(limits.maxSubscripts) + " subscripts"};
    }
    return std::nullopt;
}

auto check_length(std::size_t varnameBytes, std::size_t subscriptBytes, Limits const& limits)
    -> std::optional<Error> {
    if (varnameBytes + subscriptBytes > limits.maxPathLength) {
        return Error{Error::Code::PathTooLong,
                     "Path of " + std::to_string(varnameBytes + subscriptBytes) + " bytes exceeds the limit of "
                         + std::to_string(limits.maxPathLength)};
    }
    return std::nullopt;
}

// Validates extending the first `start` subscripts of `storage` before anything is written.
auto prepare_extension(PathStorage const& storage, std::size_t start, std::span<Subscript const> subscripts)
    -> Expected<SubscriptBatch> {
    auto const& limits = storage.options().limits;
    if (auto error = check_depth(start + subscripts.size(), limits)) {
        return std::unexpected(*error);
    }
    auto batch = SubscriptBatch::encode(subscripts, limits);
    if (!batch) {
        return std::unexpected(batch.error());
    }
    if (auto error = check_length(storage.varname().size(), storage.prefixBytes(start) + batch->totalBytes(), limits)) {
        return std::unexpected(*error);
    }
    return batch;
}

// New heap storage holding the first `keep` subscripts of `source` followed by `batch`.
auto copy_extend(PathStorage const& source, std::size_t keep, SubscriptBatch const& batch)
    -> std::shared_ptr<PathStorage> {
    auto const& options = source.options();
    auto const  depth   = keep + batch.size();
    auto const  bytes   = source.prefixBytes(keep) + batch.totalBytes();

    PathStorage::Shape const shape{.depthAlloc   = options.growth.slotCapacity(depth, options.limits),
                                   .byteCapacity = options.growth.byteCapacity(bytes, options.limits),
                                   .isMutable    = false};
    auto storage = make_storage(heap(), source.varname(), shape, options);
    storage->copyPrefix(source, keep);
    for (std::size_t index = 0; index < batch.size(); ++index) {
        storage->push(batch[index]);
    }
    storage->seal();
    return storage;
}

} // namespace

namespace SC {

auto PathBuffer::build(std::pmr::memory_resource* resource,
                       std::string_view varname,
                       std::span<Subscript const> subscripts,
                       PathOptions const& options) -> Expected<PathBuffer> {
    auto const sanitized = options.sanitized();
    auto const& limits   = sanitized.limits;
    if (auto error = check_varname(varname, limits)) {
        return std::unexpected(*error);
    }
    if (auto error = check_depth(subscripts.size(), limits)) {
        return std::unexpected(*error);
    }
    auto batch = SubscriptBatch::encode(subscripts, limits);
    if (!batch) {
        return std::unexpected(batch.error());
    }
    if (auto error = check_length(varname.size(), batch->totalBytes(), limits)) {
        return std::unexpected(*error);
    }

    PathStorage::Shape const shape{.depthAlloc   = sanitized.growth.slotCapacity(batch->size(), limits),
                                   .byteCapacity = sanitized.growth.byteCapacity(batch->totalBytes(), limits),
                                   .isMutable    = false};
    auto storage = make_storage(resource, varname, shape, sanitized);
    for (std::size_t index = 0; index < batch->size(); ++index) {
        storage->push((*batch)[index]);
    }
    storage->seal();
    return PathBuffer{Owned{std::move(storage)}};
}

auto PathBuffer::create(std::string_view varname,
                        std::span<Subscript const> subscripts,
                        PathOptions const& options) -> Expected<PathBuffer> {
    return build(heap(), varname, subscripts, options);
}

auto PathBuffer::create(std::string_view varname,
                        std::initializer_list<Subscript> subscripts,
                        PathOptions const& options) -> Expected<PathBuffer> {
    return build(heap(), varname, std::span<Subscript const>{subscripts.begin(), subscripts.size()}, options);
}

auto PathBuffer::createTransient(std::pmr::memory_resource& scratch,
                                 std::string_view varname,
                                 std::span<Subscript const> subscripts,
                                 PathOptions const& options) -> Expected<PathBuffer> {
    try {
        return build(&scratch, varname, subscripts, options);
    } catch (std::bad_alloc const&) {
        sc_log("Scratch region exhausted building " + std::string(varname), "PathBuffer", "ERROR");
        return std::unexpected(Error{Error::Code::CapacityExceeded,
                                     "Scratch region is too small for a path of "
                                         + std::to_string(subscripts.size()) + " subscripts"});
    }
}

auto PathBuffer::createTransient(std::pmr::memory_resource& scratch,
                                 std::string_view varname,
                                 std::initializer_list<Subscript> subscripts,
                                 PathOptions const& options) -> Expected<PathBuffer> {
    return createTransient(scratch, varname, std::span<Subscript const>{subscripts.begin(), subscripts.size()}, options);
}

auto PathBuffer::derive(PathBuffer const& base, std::span<Subscript const> subscripts) -> Expected<PathBuffer> {
    auto resolved = base.resolve();
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    auto const& source = *resolved->storage;
    auto batch = prepare_extension(source, resolved->depth, subscripts);
    if (!batch) {
        return std::unexpected(batch.error());
    }
    return PathBuffer{Owned{copy_extend(source, resolved->depth, *batch)}};
}

auto PathBuffer::derive(PathBuffer const& base, std::initializer_list<Subscript> subscripts) -> Expected<PathBuffer> {
    return derive(base, std::span<Subscript const>{subscripts.begin(), subscripts.size()});
}

auto PathBuffer::append(std::span<Subscript const> subscripts) const -> Expected<PathBuffer> {
    auto resolved = this->resolve();
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    return this->appendAt(resolved->depth, subscripts);
}

auto PathBuffer::append(std::initializer_list<Subscript> subscripts) const -> Expected<PathBuffer> {
    return this->append(std::span<Subscript const>{subscripts.begin(), subscripts.size()});
}

auto PathBuffer::appendAt(std::size_t depth, std::initializer_list<Subscript> subscripts) const -> Expected<PathBuffer> {
    return this->appendAt(depth, std::span<Subscript const>{subscripts.begin(), subscripts.size()});
}

auto PathBuffer::appendAt(std::size_t depth, std::span<Subscript const> subscripts) const -> Expected<PathBuffer> {
    auto resolved = this->resolve();
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    if (depth > resolved->depth) {
        return std::unexpected(Error{Error::Code::InvalidDepth,
                                     "Append depth " + std::to_string(depth) + " is outside the range 0-"
                                         + std::to_string(resolved->depth)});
    }
    if (subscripts.empty()) {
        return *this;
    }

    auto& storage = *resolved->storage;
    auto  batch   = prepare_extension(storage, depth, subscripts);
    if (!batch) {
        return std::unexpected(batch.error());
    }

    // Dry run: every slot must either already hold identical bytes or be
    // free with enough arena space left. Nothing is written unless the whole
    // batch fits, so a failed plan leaves the shared storage untouched.
    // Mutable storage is rewritten by substitute(), so children never share it.
    std::size_t slack     = storage.byteCapacity() - storage.bytesUsed();
    std::size_t firstFree = batch->size();
    bool        inPlace   = !storage.isMutable();
    for (std::size_t offset = 0; inPlace && offset < batch->size(); ++offset) {
        auto const index = depth + offset;
        auto const bytes = (*batch)[offset];
        if (index < storage.depthUsed()) {
            if (storage.subscript(index) == bytes) {
                continue;
            }
            inPlace = false;
            break;
        }
        if (index < storage.depthAlloc() && bytes.size() <= slack) {
            if (firstFree == batch->size()) {
                firstFree = offset;
            }
            slack -= bytes.size();
            continue;
        }
        inPlace = false;
        break;
    }

    auto const newDepth = depth + batch->size();
    if (inPlace) {
        for (std::size_t offset = firstFree; offset < batch->size(); ++offset) {
            storage.push((*batch)[offset]);
        }
        return this->withDepth(newDepth);
    }

    auto grown = copy_extend(storage, depth, *batch);
    sc_log("Reallocated path " + std::string(storage.varname()) + " at depth " + std::to_string(newDepth)
               + " (slots " + std::to_string(grown->depthAlloc()) + ", bytes "
               + std::to_string(grown->byteCapacity()) + ")",
           "PathBuffer");
    return PathBuffer{Owned{std::move(grown)}};
}

auto PathBuffer::toMutable() const -> Expected<PathBuffer> {
    auto resolved = this->resolve();
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    auto const& source  = *resolved->storage;
    auto const& options = source.options();
    auto const  depth   = resolved->depth;

    PathStorage::Shape const shape{.depthAlloc   = depth,
                                   .byteCapacity = options.growth.byteCapacity(source.prefixBytes(depth), options.limits),
                                   .isMutable    = true};
    auto storage = make_storage(heap(), source.varname(), shape, options);
    storage->copyPrefix(source, depth);
    storage->seal();
    return PathBuffer{Owned{std::move(storage)}};
}

auto PathBuffer::substitute(Subscript const& value) const -> Expected<PathBuffer> {
    auto resolved = this->resolve();
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    auto& storage = *resolved->storage;
    if (!storage.isMutable()) {
        return std::unexpected(Error{Error::Code::NotMutable, "Path was not produced by toMutable()"});
    }
    if (resolved->depth != storage.depthUsed()) {
        return std::unexpected(Error{Error::Code::NotMutable,
                                     "Path depth " + std::to_string(resolved->depth)
                                         + " does not match its populated depth "
                                         + std::to_string(storage.depthUsed())});
    }
    if (resolved->depth == 0) {
        return std::unexpected(Error{Error::Code::InvalidDepth, "Path has no subscript to substitute"});
    }

    auto const& limits  = storage.options().limits;
    auto        encoded = value.encode();
    if (!encoded) {
        return std::unexpected(encoded.error());
    }
    auto const bytes = encoded->bytes();
    if (bytes.size() > limits.maxSubscriptLength) {
        return std::unexpected(Error{Error::Code::SubscriptTooLong,
                                     "Subscript of " + std::to_string(bytes.size()) + " bytes exceeds the limit of "
                                         + std::to_string(limits.maxSubscriptLength)});
    }
    auto const keep   = resolved->depth - 1;
    auto const prefix = storage.prefixBytes(keep);
    if (auto error = check_length(storage.varname().size(), prefix + bytes.size(), limits)) {
        return std::unexpected(*error);
    }

    if (storage.lastSlotFits(bytes.size())) {
        storage.overwriteLast(bytes);
        return *this;
    }

    auto const& options = storage.options();
    PathStorage::Shape const shape{.depthAlloc   = resolved->depth,
                                   .byteCapacity = options.growth.byteCapacity(prefix + bytes.size(), limits),
                                   .isMutable    = true};
    auto grown = make_storage(heap(), storage.varname(), shape, options);
    grown->copyPrefix(storage, keep);
    grown->push(bytes);
    grown->seal();
    sc_log("Reallocated mutable path " + std::string(storage.varname()) + " for a "
               + std::to_string(bytes.size()) + " byte subscript",
           "PathBuffer", "Cursor");
    return PathBuffer{Owned{std::move(grown)}};
}

auto PathBuffer::depth() const noexcept -> std::size_t {
    if (auto const* owned = std::get_if<Owned>(&this->repr_)) {
        return owned->storage->depth();
    }
    auto const& view = std::get<View>(this->repr_);
    return view.depth < 0 ? 0 : static_cast<std::size_t>(view.depth);
}

auto PathBuffer::varname() const noexcept -> std::string_view {
    return this->storagePtr()->varname();
}

auto PathBuffer::at(std::ptrdiff_t depth) const -> Expected<std::string_view> {
    auto resolved = this->resolve();
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    auto const current = static_cast<std::ptrdiff_t>(resolved->depth);
    auto const index   = depth < 0 ? current + 1 + depth : depth;
    if (index > current || index < (depth < 0 ? 1 : 0)) {
        return std::unexpected(Error{Error::Code::InvalidDepth,
                                     "Depth " + std::to_string(depth) + " is outside the range -"
                                         + std::to_string(current) + "-" + std::to_string(current)});
    }
    if (index == 0) {
        return resolved->storage->varname();
    }
    return resolved->storage->subscript(static_cast<std::size_t>(index - 1));
}

auto PathBuffer::subscripts() const -> Expected<std::vector<std::string_view>> {
    auto resolved = this->resolve();
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    std::vector<std::string_view> result;
    result.reserve(resolved->depth);
    for (std::size_t index = 0; index < resolved->depth; ++index) {
        result.push_back(resolved->storage->subscript(index));
    }
    return result;
}

auto PathBuffer::isMutable() const noexcept -> bool {
    return this->storagePtr()->isMutable();
}

auto PathBuffer::isView() const noexcept -> bool {
    return std::holds_alternative<View>(this->repr_);
}

auto PathBuffer::flags() const noexcept -> Flags {
    return Flags{.isMutable = this->isMutable(), .isView = this->isView()};
}

auto PathBuffer::stats() const -> Expected<Stats> {
    auto resolved = this->resolve();
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    auto const& storage = *resolved->storage;
    return Stats{.depth        = resolved->depth,
                 .depthUsed    = storage.depthUsed(),
                 .depthAlloc   = storage.depthAlloc(),
                 .byteCapacity = storage.byteCapacity(),
                 .bytesUsed    = storage.bytesUsed(),
                 .useCount     = this->storagePtr().use_count(),
                 .flags        = this->flags()};
}

auto PathBuffer::sharesStorageWith(PathBuffer const& other) const noexcept -> bool {
    return this->storagePtr().get() == other.storagePtr().get();
}

auto PathBuffer::keyArgs() const -> Expected<KeyArgs> {
    auto resolved = this->resolve();
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    auto const& storage = *resolved->storage;
    auto const  toBuffer = [](std::string_view bytes) {
        auto const length = static_cast<unsigned int>(bytes.size());
        return EngineBuffer{.len_alloc = length, .len_used = length, .buf_addr = bytes.data()};
    };

    KeyArgs args;
    args.varname   = toBuffer(storage.varname());
    args.subs_used = static_cast<int>(resolved->depth);
    for (std::size_t index = 0; index < resolved->depth; ++index) {
        args.subsarray[index] = toBuffer(storage.subscript(index));
    }
    return args;
}

auto PathBuffer::storagePtr() const noexcept -> std::shared_ptr<PathStorage> const& {
    if (auto const* owned = std::get_if<Owned>(&this->repr_)) {
        return owned->storage;
    }
    return std::get<View>(this->repr_).root;
}

auto PathBuffer::resolve() const -> Expected<Resolved> {
    if (auto const* owned = std::get_if<Owned>(&this->repr_)) {
        return Resolved{.storage = owned->storage.get(), .depth = owned->storage->depth()};
    }
    auto const& view = std::get<View>(this->repr_);
    if (view.depth < 0 || static_cast<std::size_t>(view.depth) > view.root->depthUsed()) {
        sc_log("Corrupt view depth " + std::to_string(view.depth), "PathBuffer", "ERROR");
        return std::unexpected(Error{Error::Code::CorruptDepth,
                                     "View depth " + std::to_string(view.depth)
                                         + " is outside its root's populated range 0-"
                                         + std::to_string(view.root->depthUsed())});
    }
    return Resolved{.storage = view.root.get(), .depth = static_cast<std::size_t>(view.depth)};
}

auto PathBuffer::withDepth(std::size_t depth) const -> PathBuffer {
    auto const& storage = this->storagePtr();
    if (depth == storage->depth()) {
        return PathBuffer{Owned{storage}};
    }
    return PathBuffer{View{storage, static_cast<std::ptrdiff_t>(depth)}};
}

} // namespace SC
