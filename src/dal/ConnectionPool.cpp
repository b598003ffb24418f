#include "dal/ConnectionPool.hpp"

#include "common/Logger.hpp"

#include <stdexcept>

namespace sbu::dal {

// ── ConnectionGuard ────────────────────────────────────────────────────────

ConnectionGuard::ConnectionGuard(ConnectionPool& cpPool,
                                 std::shared_ptr<pqxx::connection> spConn)
    : _pPool(&cpPool), _spConn(std::move(spConn)) {}

ConnectionGuard::~ConnectionGuard() {
  if (_spConn && _pPool) {
    _pPool->returnConnection(std::move(_spConn));
  }
}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : _pPool(other._pPool), _spConn(std::move(other._spConn)) {
  other._pPool = nullptr;
}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
  if (this != &other) {
    if (_spConn && _pPool) {
      _pPool->returnConnection(std::move(_spConn));
    }
    _pPool = other._pPool;
    _spConn = std::move(other._spConn);
    other._pPool = nullptr;
  }
  return *this;
}

pqxx::connection& ConnectionGuard::operator*() { return *_spConn; }
pqxx::connection* ConnectionGuard::operator->() { return _spConn.get(); }

// ── ConnectionPool ─────────────────────────────────────────────────────────

ConnectionPool::ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                               std::chrono::seconds durCheckoutTimeout)
    : _sDbUrl(sDbUrl), _iPoolSize(iPoolSize), _durCheckoutTimeout(durCheckoutTimeout) {
  if (_iPoolSize < 1) {
    throw std::invalid_argument("Connection pool size must be >= 1");
  }

  auto spLog = common::Logger::get();
  // Log only the host part; the URL may carry credentials
  const auto nAt = _sDbUrl.find('@');
  spLog->info("Opening catalog connection pool: size={}, host={}", _iPoolSize,
              nAt == std::string::npos ? std::string("<local>") : _sDbUrl.substr(nAt + 1));

  _vAvailable.reserve(static_cast<size_t>(_iPoolSize));
  for (int i = 0; i < _iPoolSize; ++i) {
    _vAvailable.push_back(open());
  }
}

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.clear();
}

std::shared_ptr<pqxx::connection> ConnectionPool::open() {
  auto spConn = std::make_shared<pqxx::connection>(_sDbUrl);
  if (!spConn->is_open()) {
    throw std::runtime_error("Failed to open catalog database connection");
  }
  return spConn;
}

ConnectionGuard ConnectionPool::checkout() {
  std::unique_lock<std::mutex> lock(_mtx);

  const bool bAvailable = _cv.wait_for(lock, _durCheckoutTimeout, [this] {
    return !_vAvailable.empty();
  });

  if (!bAvailable) {
    throw std::runtime_error("Connection pool exhausted: timeout waiting for available connection");
  }

  auto spConn = std::move(_vAvailable.back());
  _vAvailable.pop_back();
  lock.unlock();

  if (!validate(*spConn)) {
    common::Logger::get()->warn("Stale catalog connection detected, reconnecting");
    try {
      spConn = open();
    } catch (...) {
      // Keep the slot; the stale handle is retried on the next checkout
      returnConnection(std::move(spConn));
      throw;
    }
  }

  return ConnectionGuard(*this, std::move(spConn));
}

void ConnectionPool::returnConnection(std::shared_ptr<pqxx::connection> spConn) {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.push_back(std::move(spConn));
  _cv.notify_one();
}

bool ConnectionPool::validate(pqxx::connection& conn) {
  try {
    pqxx::nontransaction ntx(conn);
    ntx.exec("SELECT 1").one_row();
    return true;
  } catch (const pqxx::failure&) {
    return false;
  }
}

}  // namespace sbu::dal
