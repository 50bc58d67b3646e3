#pragma once

/**
 * @file entity_store.hpp
 * @brief Owner of the Actors and Movies relations.
 *
 * Each relation is an EntityTable: an insertion-ordered list of records
 * plus an id → node map for O(1) lookup and erase. Ids come from one
 * monotonic counter per table and are never handed out twice, even after
 * the record holding them is deleted.
 *
 * Deletes cascade into the RelationIndex passed by the caller so that no
 * Movie_Actors row ever outlives the entity it references.
 */

#include "reel/error.hpp"
#include "reel/schema.hpp"
#include <iterator>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace reel {

class RelationIndex;

/**
 * @brief Insertion-ordered record table with auto-increment identity.
 *
 * Record must expose a mutable `id` member of integral type.
 */
template <typename Record> class EntityTable {
public:
  using id_type = decltype(Record::id);

  /// Assigns the next id to `record`, stores it and returns the id.
  id_type insert(Record record) {
    record.id = next_id_++;
    rows_.push_back(std::move(record));
    slots_.emplace(rows_.back().id, std::prev(rows_.end()));
    return rows_.back().id;
  }

  /// Returns false if `id` is not present.
  bool erase(id_type id) {
    auto it = slots_.find(id);
    if (it == slots_.end())
      return false;
    rows_.erase(it->second);
    slots_.erase(it);
    return true;
  }

  const Record *find(id_type id) const noexcept {
    auto it = slots_.find(id);
    return it == slots_.end() ? nullptr : &*it->second;
  }

  bool contains(id_type id) const noexcept { return slots_.contains(id); }

  size_t size() const noexcept { return rows_.size(); }

  /// Id the next insert will receive.
  id_type next_id() const noexcept { return next_id_; }

  /// Snapshot copy in insertion order.
  std::vector<Record> snapshot() const {
    return std::vector<Record>(rows_.begin(), rows_.end());
  }

  auto begin() const noexcept { return rows_.cbegin(); }
  auto end() const noexcept { return rows_.cend(); }

private:
  std::list<Record> rows_;
  std::unordered_map<id_type, typename std::list<Record>::iterator> slots_;
  id_type next_id_ = FIRST_ENTITY_ID;
};

class EntityStore {
public:
  EntityStore() = default;

  // Non-copyable (RelationIndex rows reference ids issued by this store)
  EntityStore(const EntityStore &) = delete;
  EntityStore &operator=(const EntityStore &) = delete;

  /**
   * @brief Inserts an Actor.
   * @return The new id, or CatalogError::Validation if `name` is empty.
   */
  Result<ActorId> insert_actor(std::string name,
                               std::optional<int> age = std::nullopt);

  /**
   * @brief Inserts a Movie.
   * @return The new id, or CatalogError::Validation if `title` is empty.
   */
  Result<MovieId> insert_movie(std::string title,
                               std::optional<int> release_year = std::nullopt);

  Result<Actor> get_actor(ActorId id) const;
  Result<Movie> get_movie(MovieId id) const;

  /**
   * @brief Removes an Actor and every Movie_Actors row referencing it.
   *
   * Either the record and all of its rows go, or (on NotFound) nothing
   * changes.
   */
  Result<void> delete_actor(ActorId id, RelationIndex &relations);

  /// Movie counterpart of delete_actor().
  Result<void> delete_movie(MovieId id, RelationIndex &relations);

  bool contains_actor(ActorId id) const noexcept {
    return actors_.contains(id);
  }
  bool contains_movie(MovieId id) const noexcept {
    return movies_.contains(id);
  }

  /// Zero-copy lookups for the query layer. nullptr if absent.
  const Actor *find_actor(ActorId id) const noexcept {
    return actors_.find(id);
  }
  const Movie *find_movie(MovieId id) const noexcept {
    return movies_.find(id);
  }

  std::vector<Actor> list_actors() const { return actors_.snapshot(); }
  std::vector<Movie> list_movies() const { return movies_.snapshot(); }

  size_t actor_count() const noexcept { return actors_.size(); }
  size_t movie_count() const noexcept { return movies_.size(); }

  /// Insertion-ordered views used by QueryEngine scans.
  const EntityTable<Actor> &actors() const noexcept { return actors_; }
  const EntityTable<Movie> &movies() const noexcept { return movies_; }

private:
  EntityTable<Actor> actors_;
  EntityTable<Movie> movies_;
};

} // namespace reel
