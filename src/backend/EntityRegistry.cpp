#include "EntityRegistry.h"

#include "backend/LogStore.h"

#include <QSet>

#include <algorithm>
#include <cmath>

namespace {

int kindRank(EntityKind kind)
{
  return kind == EntityKind::Device ? 0 : 1;
}

QString kindLabel(EntityKind kind)
{
  return kind == EntityKind::Device ? QStringLiteral("device") : QStringLiteral("stream");
}

void logRegistry(LogStore::Level level, const QString& message)
{
  LogStore::log(level, QStringLiteral("Faders/Registry"), message);
}

} // namespace

bool EntityRegistry::KeyLess::operator()(const Key& a, const Key& b) const
{
  if (a.kind != b.kind) {
    return kindRank(a.kind) < kindRank(b.kind);
  }
  return a.name < b.name;
}

EntityRegistry::EntityRegistry(ControlEndpoint* endpoint, RegistryOptions options)
    : m_endpoint(endpoint)
    , m_options(std::move(options))
{
  m_options.maxLevel = std::max(1, m_options.maxLevel);
  m_options.cacheTtlMs = std::max(0, m_options.cacheTtlMs);
  m_elapsed.start();
}

qint64 EntityRegistry::nowMs() const
{
  return m_clock ? m_clock() : m_elapsed.elapsed();
}

bool EntityRegistry::isFresh(qint64 capturedAtMs) const
{
  return nowMs() - capturedAtMs < m_options.cacheTtlMs;
}

MixerEntity* EntityRegistry::find(const QString& name)
{
  const auto kindIt = m_kindByName.constFind(name);
  if (kindIt == m_kindByName.constEnd()) {
    return nullptr;
  }
  const auto it = m_entities.find(Key{kindIt.value(), name});
  return it == m_entities.end() ? nullptr : &it->second;
}

const MixerEntity* EntityRegistry::entity(const QString& name) const
{
  return const_cast<EntityRegistry*>(this)->find(name);
}

const MixerEntity* EntityRegistry::findByPath(const QString& path) const
{
  for (const auto& [key, e] : m_entities) {
    if (e.path == path) {
      return &e;
    }
  }
  return nullptr;
}

QString EntityRegistry::nameForPath(const QString& path) const
{
  const MixerEntity* e = findByPath(path);
  return e ? e->name : QString();
}

QStringList EntityRegistry::names() const
{
  QStringList out;
  out.reserve(static_cast<int>(m_entities.size()));
  for (const auto& [key, e] : m_entities) {
    out.push_back(key.name);
  }
  return out;
}

QString EntityRegistry::firstKey() const
{
  return m_entities.empty() ? QString() : m_entities.begin()->first.name;
}

QString EntityRegistry::nextKey(const QString& name) const
{
  const QStringList keys = names();
  if (keys.isEmpty()) {
    return QString();
  }
  const int idx = keys.indexOf(name);
  if (idx < 0) {
    return keys.first();
  }
  return keys.at((idx + 1) % keys.size());
}

QString EntityRegistry::prevKey(const QString& name) const
{
  const QStringList keys = names();
  if (keys.isEmpty()) {
    return QString();
  }
  const int idx = keys.indexOf(name);
  if (idx < 0) {
    return keys.last();
  }
  return keys.at((idx - 1 + keys.size()) % keys.size());
}

QString EntityRegistry::freeUniqueName(const QString& base)
{
  QString candidate = m_counter.uniqueName(base);
  while (contains(candidate)) {
    candidate = m_counter.uniqueName(base);
  }
  return candidate;
}

void EntityRegistry::insertEntity(MixerEntity entity)
{
  m_maxNameLength = std::max(m_maxNameLength, static_cast<int>(entity.name.size()));
  m_kindByName.insert(entity.name, entity.kind);
  Key key{entity.kind, entity.name};
  m_entities.insert_or_assign(std::move(key), std::move(entity));
}

void EntityRegistry::renameEntity(const QString& from, const QString& to)
{
  const auto kindIt = m_kindByName.constFind(from);
  if (kindIt == m_kindByName.constEnd()) {
    return;
  }

  auto node = m_entities.extract(Key{kindIt.value(), from});
  m_kindByName.remove(from);
  if (node.empty()) {
    return;
  }

  MixerEntity e = std::move(node.mapped());
  e.name = to;
  insertEntity(std::move(e));
  recomputeMaxNameLength();
}

void EntityRegistry::recomputeMaxNameLength()
{
  int longest = 0;
  for (const auto& [key, e] : m_entities) {
    longest = std::max(longest, static_cast<int>(key.name.size()));
  }
  m_maxNameLength = longest;
}

bool EntityRegistry::insertFromRemote(const QString& path, EntityKind kind, QString* nameOut, QString* error)
{
  if (const MixerEntity* existing = findByPath(path)) {
    *nameOut = existing->name;
    return true;
  }

  PropertyList props;
  if (!m_endpoint->properties(path, kind, &props, error)) {
    return false;
  }

  QString name = entityDisplayName(kind, props, m_options.naming, m_counter);
  if (contains(name)) {
    // both sides of a clash end up suffixed
    renameEntity(name, freeUniqueName(name));
    name = freeUniqueName(name);
  }

  MixerEntity e;
  e.name = name;
  e.kind = kind;
  e.path = path;
  insertEntity(std::move(e));

  logRegistry(LogStore::Level::Debug, QStringLiteral("Added %1 %2 as \"%3\"").arg(kindLabel(kind), path, name));
  *nameOut = name;
  return true;
}

template <typename Call>
RemoteResult EntityRegistry::failsafe(const QString& what, Call&& call)
{
  QString err;
  RemoteResult res = call(&err);
  if (res != RemoteResult::Failed) {
    return res;
  }

  if (!m_refreshing) {
    logRegistry(LogStore::Level::Warning, QStringLiteral("%1 failed (%2), reconnecting").arg(what, err));
    QString refreshErr;
    if (refresh(false, &refreshErr)) {
      err.clear();
      res = call(&err);
      if (res != RemoteResult::Failed) {
        return res;
      }
    } else {
      err = refreshErr;
    }
  }

  logRegistry(LogStore::Level::Error, QStringLiteral("%1 failed after reconnect: %2").arg(what, err));
  if (!m_failed) {
    m_failed = true;
    if (m_failureHook) {
      m_failureHook();
    }
  }
  return RemoteResult::Failed;
}

std::optional<QString> EntityRegistry::add(const QString& path, EntityKind kind)
{
  QString name;
  bool retrying = false;
  const RemoteResult res = failsafe(QStringLiteral("add %1 %2").arg(kindLabel(kind), path), [&](QString* err) {
    // the hard refresh before the retry inserted every live path
    if (retrying && !findByPath(path)) {
      logRegistry(LogStore::Level::Debug, QStringLiteral("%1 vanished before it could be added").arg(path));
      return RemoteResult::Stale;
    }
    retrying = true;
    return insertFromRemote(path, kind, &name, err) ? RemoteResult::Ok : RemoteResult::Failed;
  });
  if (res != RemoteResult::Ok) {
    return std::nullopt;
  }
  return name;
}

bool EntityRegistry::remove(const QString& path)
{
  const MixerEntity* e = findByPath(path);
  if (!e) {
    return false;
  }

  const Key key{e->kind, e->name};
  const int len = static_cast<int>(key.name.size());
  m_kindByName.remove(key.name);
  m_entities.erase(key);

  if (len == m_maxNameLength) {
    recomputeMaxNameLength();
  }

  logRegistry(LogStore::Level::Debug, QStringLiteral("Removed %1 (\"%2\")").arg(path, key.name));
  return true;
}

void EntityRegistry::applyPendingEvents()
{
  while (!m_updates.empty() && !m_failed) {
    const PendingEvent ev = m_updates.front();
    m_updates.pop_front();

    if (ev.isAddition()) {
      add(ev.path, ev.kind());
    } else {
      remove(ev.path);
    }
  }
}

bool EntityRegistry::snapshot(QStringList* streams, QStringList* sinks, QString* error)
{
  return m_endpoint->listPlaybackStreams(streams, error) && m_endpoint->listSinks(sinks, error);
}

bool EntityRegistry::hardRefresh(QString* error)
{
  m_entities.clear();
  m_kindByName.clear();
  m_maxNameLength = 0;

  if (!m_endpoint->reconnect(error)) {
    return false;
  }

  QStringList streams;
  QStringList sinks;
  if (!snapshot(&streams, &sinks, error)) {
    return false;
  }

  QString name;
  for (const auto& path : streams) {
    if (!insertFromRemote(path, EntityKind::Stream, &name, error)) {
      return false;
    }
  }
  for (const auto& path : sinks) {
    if (!insertFromRemote(path, EntityKind::Device, &name, error)) {
      return false;
    }
  }
  return true;
}

bool EntityRegistry::softRefresh(QString* error)
{
  QStringList streams;
  QStringList sinks;
  if (!snapshot(&streams, &sinks, error)) {
    return false;
  }

  QSet<QString> live;
  for (const auto& p : streams) {
    live.insert(p);
  }
  for (const auto& p : sinks) {
    live.insert(p);
  }

  QStringList gone;
  for (const auto& [key, e] : m_entities) {
    if (!live.contains(e.path)) {
      gone.push_back(e.path);
    }
  }
  for (const auto& path : gone) {
    remove(path);
  }

  QString name;
  for (const auto& path : streams) {
    if (!insertFromRemote(path, EntityKind::Stream, &name, error)) {
      return false;
    }
  }
  for (const auto& path : sinks) {
    if (!insertFromRemote(path, EntityKind::Device, &name, error)) {
      return false;
    }
  }
  return true;
}

bool EntityRegistry::refresh(bool soft, QString* error)
{
  if (m_refreshing) {
    if (error) {
      *error = QStringLiteral("refresh already in progress");
    }
    return false;
  }

  logRegistry(LogStore::Level::Debug, soft ? QStringLiteral("Soft refresh") : QStringLiteral("Hard refresh"));

  QString err;
  m_refreshing = true;
  const bool ok = soft ? softRefresh(&err) : hardRefresh(&err);
  m_refreshing = false;

  if (!ok) {
    if (soft) {
      logRegistry(LogStore::Level::Warning, QStringLiteral("Soft refresh failed (%1), rebuilding").arg(err));
      return refresh(false, error);
    }
    logRegistry(LogStore::Level::Error, QStringLiteral("Hard refresh failed: %1").arg(err));
    if (error) {
      *error = err;
    }
    return false;
  }

  if (!soft && m_reacquireHook) {
    m_reacquireHook();
  }
  return true;
}

RemoteResult EntityRegistry::channelVolumes(const QString& name, QVector<float>* out)
{
  const MixerEntity* e = find(name);
  if (!e) {
    return RemoteResult::Stale;
  }
  if (e->volume && isFresh(e->volume->capturedAtMs)) {
    *out = e->volume->levels;
    return RemoteResult::Ok;
  }

  QVector<uint32_t> raw;
  const RemoteResult res = failsafe(QStringLiteral("get volume of \"%1\"").arg(name), [&](QString* err) {
    const MixerEntity* cur = find(name);
    if (!cur) {
      return RemoteResult::Stale;
    }
    return m_endpoint->volume(cur->path, cur->kind, &raw, err) ? RemoteResult::Ok : RemoteResult::Failed;
  });
  if (res != RemoteResult::Ok) {
    return res;
  }

  MixerEntity* cur = find(name);
  if (!cur) {
    return RemoteResult::Stale;
  }

  QVector<float> levels;
  levels.reserve(raw.size());
  for (uint32_t v : raw) {
    levels.push_back(std::min(static_cast<float>(v) / static_cast<float>(m_options.maxLevel), 1.0f));
  }
  cur->volume = CachedVolume{levels, nowMs()};
  *out = levels;
  return RemoteResult::Ok;
}

RemoteResult EntityRegistry::volume(const QString& name, float* out)
{
  QVector<float> levels;
  const RemoteResult res = channelVolumes(name, &levels);
  if (res != RemoteResult::Ok) {
    return res;
  }

  float sum = 0.0f;
  for (float v : levels) {
    sum += v;
  }
  *out = levels.isEmpty() ? 0.0f : sum / static_cast<float>(levels.size());
  return RemoteResult::Ok;
}

RemoteResult EntityRegistry::setVolume(const QString& name, float level)
{
  QVector<float> current;
  const RemoteResult got = channelVolumes(name, &current);
  if (got != RemoteResult::Ok) {
    return got;
  }

  level = std::isfinite(level) ? std::clamp(level, 0.0f, 1.0f) : 0.0f;
  const int channels = current.size();
  const auto rawLevel = static_cast<uint32_t>(std::lround(static_cast<double>(level) * m_options.maxLevel));
  const QVector<uint32_t> raw(channels, rawLevel);

  const RemoteResult res = failsafe(QStringLiteral("set volume of \"%1\"").arg(name), [&](QString* err) {
    const MixerEntity* cur = find(name);
    if (!cur) {
      return RemoteResult::Stale;
    }
    return m_endpoint->setVolume(cur->path, cur->kind, raw, err) ? RemoteResult::Ok : RemoteResult::Failed;
  });
  if (res != RemoteResult::Ok) {
    return res;
  }

  MixerEntity* cur = find(name);
  if (!cur) {
    return RemoteResult::Stale;
  }
  cur->volume = CachedVolume{QVector<float>(channels, level), nowMs()};
  return RemoteResult::Ok;
}

RemoteResult EntityRegistry::mute(const QString& name, bool* out)
{
  const MixerEntity* e = find(name);
  if (!e) {
    return RemoteResult::Stale;
  }
  if (e->mute && isFresh(e->mute->capturedAtMs)) {
    *out = e->mute->muted;
    return RemoteResult::Ok;
  }

  bool muted = false;
  const RemoteResult res = failsafe(QStringLiteral("get mute of \"%1\"").arg(name), [&](QString* err) {
    const MixerEntity* cur = find(name);
    if (!cur) {
      return RemoteResult::Stale;
    }
    return m_endpoint->mute(cur->path, cur->kind, &muted, err) ? RemoteResult::Ok : RemoteResult::Failed;
  });
  if (res != RemoteResult::Ok) {
    return res;
  }

  MixerEntity* cur = find(name);
  if (!cur) {
    return RemoteResult::Stale;
  }
  cur->mute = CachedMute{muted, nowMs()};
  *out = muted;
  return RemoteResult::Ok;
}

RemoteResult EntityRegistry::setMute(const QString& name, bool muted)
{
  const RemoteResult res = failsafe(QStringLiteral("set mute of \"%1\"").arg(name), [&](QString* err) {
    const MixerEntity* cur = find(name);
    if (!cur) {
      return RemoteResult::Stale;
    }
    return m_endpoint->setMute(cur->path, cur->kind, muted, err) ? RemoteResult::Ok : RemoteResult::Failed;
  });
  if (res != RemoteResult::Ok) {
    return res;
  }

  MixerEntity* cur = find(name);
  if (!cur) {
    return RemoteResult::Stale;
  }
  cur->mute = CachedMute{muted, nowMs()};
  return RemoteResult::Ok;
}
