#pragma once

#include "backend/ControlEndpoint.h"
#include "backend/EntityNaming.h"
#include "backend/PendingEvent.h"

#include <QElapsedTimer>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include <deque>
#include <functional>
#include <map>
#include <optional>

struct CachedVolume final {
  QVector<float> levels; // per channel, 0..1
  qint64 capturedAtMs = 0;
};

struct CachedMute final {
  bool muted = false;
  qint64 capturedAtMs = 0;
};

struct MixerEntity final {
  QString name;
  EntityKind kind = EntityKind::Stream;
  QString path;

  std::optional<CachedVolume> volume;
  std::optional<CachedMute> mute;
};

struct RegistryOptions final {
  int maxLevel = 65536;
  int cacheTtlMs = 2000;
  NamingOptions naming;
};

enum class RemoteResult {
  Ok,
  Stale,  // entity is gone; abandon the current frame
  Failed, // reconnect + retry failed too; failure hook already fired
};

// Display-name keyed set of streams and devices, iterated in (kind, name) order:
// devices first, then streams. Owned and mutated by the UI thread only.
class EntityRegistry final
{
public:
  using Hook = std::function<void()>;
  using Clock = std::function<qint64()>;

  explicit EntityRegistry(ControlEndpoint* endpoint, RegistryOptions options = {});

  EntityRegistry(const EntityRegistry&) = delete;
  EntityRegistry& operator=(const EntityRegistry&) = delete;

  // Called once when a remote call still fails after reconnect + retry.
  void setFailureHook(Hook hook) { m_failureHook = std::move(hook); }
  // Called after every successful hard refresh so the event monitor can
  // reacquire its own connection.
  void setReacquireHook(Hook hook) { m_reacquireHook = std::move(hook); }
  void setClockForTesting(Clock clock) { m_clock = std::move(clock); }

  const RegistryOptions& options() const { return m_options; }

  bool refresh(bool soft = true, QString* error = nullptr);

  std::optional<QString> add(const QString& path, EntityKind kind);
  bool remove(const QString& path);

  void enqueue(const PendingEvent& event) { m_updates.push_back(event); }
  bool hasPendingEvents() const { return !m_updates.empty(); }
  int pendingCount() const { return static_cast<int>(m_updates.size()); }
  void applyPendingEvents();

  RemoteResult volume(const QString& name, float* out);
  RemoteResult channelVolumes(const QString& name, QVector<float>* out);
  RemoteResult setVolume(const QString& name, float level);

  RemoteResult mute(const QString& name, bool* out);
  RemoteResult setMute(const QString& name, bool muted);

  QString nextKey(const QString& name) const;
  QString prevKey(const QString& name) const;
  QString firstKey() const;

  QStringList names() const;
  bool contains(const QString& name) const { return m_kindByName.contains(name); }
  const MixerEntity* entity(const QString& name) const;
  QString nameForPath(const QString& path) const;

  int size() const { return static_cast<int>(m_entities.size()); }
  bool isEmpty() const { return m_entities.empty(); }
  int maxNameLength() const { return m_maxNameLength; }

  bool hasFailed() const { return m_failed; }

private:
  struct Key final {
    EntityKind kind = EntityKind::Stream;
    QString name;
  };

  struct KeyLess final {
    bool operator()(const Key& a, const Key& b) const;
  };

  MixerEntity* find(const QString& name);
  const MixerEntity* findByPath(const QString& path) const;

  bool hardRefresh(QString* error);
  bool softRefresh(QString* error);
  bool snapshot(QStringList* streams, QStringList* sinks, QString* error);
  bool insertFromRemote(const QString& path, EntityKind kind, QString* nameOut, QString* error);

  QString freeUniqueName(const QString& base);
  void insertEntity(MixerEntity entity);
  void renameEntity(const QString& from, const QString& to);
  void recomputeMaxNameLength();

  template <typename Call>
  RemoteResult failsafe(const QString& what, Call&& call);

  qint64 nowMs() const;
  bool isFresh(qint64 capturedAtMs) const;

  ControlEndpoint* m_endpoint = nullptr;
  RegistryOptions m_options;
  UniqueNameCounter m_counter;

  std::map<Key, MixerEntity, KeyLess> m_entities;
  QHash<QString, EntityKind> m_kindByName;
  std::deque<PendingEvent> m_updates;

  int m_maxNameLength = 0;
  bool m_refreshing = false;
  bool m_failed = false;

  Hook m_failureHook;
  Hook m_reacquireHook;
  Clock m_clock;
  QElapsedTimer m_elapsed;
};
