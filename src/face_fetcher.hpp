#ifndef SBSYNC_FACE_FETCHER_HPP
#define SBSYNC_FACE_FETCHER_HPP

#include "fetcher.hpp"

#include <ndn-cxx/face.hpp>
#include <ndn-cxx/util/time.hpp>

namespace sbsync {

/**
 * @brief Fetches a delta source published as a single Data packet
 *
 * The location is the Data name. fetch() drives the face's event loop
 * until the Interest is satisfied, Nacked, or times out.
 */
class FaceFetcher : public Fetcher
{
public:
  FaceFetcher(ndn::Face& face, const ndn::time::milliseconds& interestLifetime);

  ndn::ConstBufferPtr
  fetch(const std::string& location) override;

private:
  void
  onData(const ndn::Interest& interest, const ndn::Data& data);

  void
  onNack(const ndn::Interest& interest, const ndn::lp::Nack& nack);

  void
  onTimeout(const ndn::Interest& interest);

private:
  ndn::Face& m_face;
  ndn::time::milliseconds m_interestLifetime;

  ndn::ConstBufferPtr m_content;
  std::string m_error;
};

} // namespace sbsync

#endif // SBSYNC_FACE_FETCHER_HPP
