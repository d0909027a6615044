#pragma once

#include "core/clip.hpp"
#include "core/config.hpp"
#include "storage/slot_backend.hpp"
#include <QMutex>
#include <memory>

namespace clipsync::storage {

/**
 * ClipStore - durable single-slot holder of the latest clip.
 *
 * The in-memory slot always mirrors the last successfully persisted
 * document; a failed write leaves it untouched. Writes are serialized by an
 * internal mutex, so concurrent callers resolve in arrival order and every
 * write replaces the slot wholesale.
 */
class ClipStore {
public:
    /**
     * Takes ownership of the backend and loads whatever it holds.
     */
    explicit ClipStore(std::unique_ptr<SlotBackend> backend);

    ClipStore(const ClipStore&) = delete;
    ClipStore& operator=(const ClipStore&) = delete;

    /**
     * Re-read persisted state. Absent or corrupt state yields an empty slot;
     * this never fails.
     */
    StoreSlot load();

    /**
     * Persist `clip` as the new slot. The store assigns the revision; the
     * caller is expected to have stamped created_at. Returns the clip as
     * stored, or a Persistence error with the previous slot still current.
     */
    [[nodiscard]] Result<Clip, Error> save(Clip clip);

    /**
     * Last successfully persisted slot.
     */
    [[nodiscard]] StoreSlot current() const;

    [[nodiscard]] QString location() const;

private:
    std::unique_ptr<SlotBackend> backend_;
    mutable QMutex mu_;
    StoreSlot slot_;
};

/**
 * Build the backend selected by `config` (json file or sqlite).
 */
[[nodiscard]] Result<std::unique_ptr<SlotBackend>, Error> make_backend(const Config& config);

} // namespace clipsync::storage
