#include "face_fetcher.hpp"

#include <ndn-cxx/lp/nack.hpp>
#include <ndn-cxx/util/logger.hpp>

#include <boost/lexical_cast.hpp>
#include <boost/throw_exception.hpp>

#include <memory>

namespace sbsync {

NDN_LOG_INIT(sbsync.FaceFetcher);

FaceFetcher::FaceFetcher(ndn::Face& face, const ndn::time::milliseconds& interestLifetime)
  : m_face(face)
  , m_interestLifetime(interestLifetime)
{
}

ndn::ConstBufferPtr
FaceFetcher::fetch(const std::string& location)
{
  m_content.reset();
  m_error.clear();

  ndn::Interest interest((ndn::Name(location)));
  interest.setInterestLifetime(m_interestLifetime);
  interest.setMustBeFresh(true);

  NDN_LOG_DEBUG("Fetching " << interest.getName());
  m_face.expressInterest(interest,
                         [this] (const ndn::Interest& i, const ndn::Data& d) { onData(i, d); },
                         [this] (const ndn::Interest& i, const ndn::lp::Nack& n) { onNack(i, n); },
                         [this] (const ndn::Interest& i) { onTimeout(i); });
  m_face.processEvents();

  if (m_content == nullptr) {
    if (m_error.empty()) {
      m_error = "no response";
    }
    BOOST_THROW_EXCEPTION(Error("Cannot fetch " + location + ": " + m_error));
  }

  ndn::ConstBufferPtr content = m_content;
  m_content.reset();
  return content;
}

void
FaceFetcher::onData(const ndn::Interest& interest, const ndn::Data& data)
{
  const ndn::Block& content = data.getContent();
  NDN_LOG_DEBUG("Received " << data.getName() << " with " << content.value_size() << " bytes");
  m_content = std::make_shared<ndn::Buffer>(content.value(), content.value_size());
}

void
FaceFetcher::onNack(const ndn::Interest& interest, const ndn::lp::Nack& nack)
{
  m_error = "Nack " + boost::lexical_cast<std::string>(nack.getReason());
  NDN_LOG_WARN(interest.getName() << ": " << m_error);
}

void
FaceFetcher::onTimeout(const ndn::Interest& interest)
{
  m_error = "timeout";
  NDN_LOG_WARN(interest.getName() << ": " << m_error);
}

} // namespace sbsync
