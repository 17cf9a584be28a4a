#ifndef SBSYNC_HASH_SET_HPP
#define SBSYNC_HASH_SET_HPP

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace sbsync {

static const size_t PREFIX_4B_SZ = 4;
static const size_t PREFIX_32B_SZ = 32;

/**
 * @brief Mutable set of fixed-width byte strings
 *
 * Used for 4-byte hash prefixes, 32-byte full hashes and 32-byte resolved
 * hashes. Keys of another width are rejected.
 */
class HashSet
{
public:
  class Error : public std::invalid_argument
  {
  public:
    explicit
    Error(const std::string& what)
      : std::invalid_argument(what)
    {
    }
  };

  virtual
  ~HashSet();

  /// @brief adds @p key, no effect if already present
  virtual void
  insert(const std::string& key) = 0;

  /// @brief removes @p key, no effect if absent
  virtual void
  erase(const std::string& key) = 0;

  virtual bool
  contains(const std::string& key) const = 0;

  virtual size_t
  size() const = 0;

  virtual void
  forEach(const std::function<void(const std::string&)>& visit) const = 0;

  size_t
  getKeyWidth() const
  {
    return m_keyWidth;
  }

protected:
  explicit
  HashSet(size_t keyWidth);

  void
  checkKey(const std::string& key) const;

private:
  size_t m_keyWidth;
};

/**
 * @brief HashSet backed by a hash table keyed with MurmurHash3
 */
class UnorderedHashSet : public HashSet
{
public:
  explicit
  UnorderedHashSet(size_t keyWidth);

  void
  insert(const std::string& key) override;

  void
  erase(const std::string& key) override;

  bool
  contains(const std::string& key) const override;

  size_t
  size() const override;

  void
  forEach(const std::function<void(const std::string&)>& visit) const override;

private:
  struct KeyHash
  {
    size_t
    operator()(const std::string& key) const;
  };

  std::unordered_set<std::string, KeyHash> m_keys;
};

typedef std::function<std::unique_ptr<HashSet>(size_t keyWidth)> HashSetFactory;

std::unique_ptr<HashSet>
makeUnorderedHashSet(size_t keyWidth);

} // namespace sbsync

#endif // SBSYNC_HASH_SET_HPP
