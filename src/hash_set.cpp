#include "hash_set.hpp"
#include "util/murmurhash3.hpp"

#include <boost/throw_exception.hpp>

namespace sbsync {

static const uint32_t HASH_SET_SEED = 11;

HashSet::HashSet(size_t keyWidth)
  : m_keyWidth(keyWidth)
{
  if (keyWidth == 0) {
    BOOST_THROW_EXCEPTION(Error("HashSet key width must be positive"));
  }
}

HashSet::~HashSet()
{
}

void
HashSet::checkKey(const std::string& key) const
{
  if (key.size() != m_keyWidth) {
    BOOST_THROW_EXCEPTION(Error("Expected a " + std::to_string(m_keyWidth) + "-byte key, got " +
                                std::to_string(key.size()) + " bytes"));
  }
}

size_t
UnorderedHashSet::KeyHash::operator()(const std::string& key) const
{
  return MurmurHash3(HASH_SET_SEED, key);
}

UnorderedHashSet::UnorderedHashSet(size_t keyWidth)
  : HashSet(keyWidth)
{
}

void
UnorderedHashSet::insert(const std::string& key)
{
  checkKey(key);
  m_keys.insert(key);
}

void
UnorderedHashSet::erase(const std::string& key)
{
  checkKey(key);
  m_keys.erase(key);
}

bool
UnorderedHashSet::contains(const std::string& key) const
{
  if (key.size() != getKeyWidth()) {
    return false;
  }
  return m_keys.find(key) != m_keys.end();
}

size_t
UnorderedHashSet::size() const
{
  return m_keys.size();
}

void
UnorderedHashSet::forEach(const std::function<void(const std::string&)>& visit) const
{
  for (const auto& key : m_keys) {
    visit(key);
  }
}

std::unique_ptr<HashSet>
makeUnorderedHashSet(size_t keyWidth)
{
  return std::unique_ptr<HashSet>(new UnorderedHashSet(keyWidth));
}

} // namespace sbsync
