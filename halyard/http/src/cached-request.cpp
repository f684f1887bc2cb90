#include "halyard/cached-request.hpp"

#include <string>

#include "halyard/log.hpp"

namespace halyard {

std::string CachedRequest::readBody() {
  if (_bodyCached) {
    return _body;
  }
  if (_bodyRead) {
    return {};
  }
  std::string body = _request->readBody();
  _bodyRead = true;
  if (body.size() <= _maxCachedBodySize) {
    _body = body;
    _bodyCached = true;
  } else {
    log::debug("Request body of {} bytes exceeds cache limit of {} bytes, it can only be read once", body.size(),
               _maxCachedBodySize);
  }
  return body;
}

}  // namespace halyard
