#pragma once

#include "backend/ControlEndpoint.h"

#include <QMap>
#include <QStringList>
#include <QVector>

#include <utility>

// In-memory sound server used by the registry and TUI tests.
class FakeControlEndpoint final : public ControlEndpoint
{
public:
  struct Object final {
    EntityKind kind = EntityKind::Stream;
    PropertyList props;
    QVector<uint32_t> levels{32768, 32768};
    bool muted = false;
  };

  void addStream(const QString& path, const QString& appName, QVector<uint32_t> levels = {32768, 32768})
  {
    Object o;
    o.kind = EntityKind::Stream;
    if (!appName.isEmpty()) {
      o.props.insert(QStringLiteral("application.name"), appName.toUtf8());
    }
    o.levels = std::move(levels);
    insert(path, o);
  }

  void addDevice(const QString& path, const QString& alsaId, QVector<uint32_t> levels = {32768, 32768})
  {
    Object o;
    o.kind = EntityKind::Device;
    o.props.insert(QStringLiteral("alsa.id"), alsaId.toUtf8());
    o.levels = std::move(levels);
    insert(path, o);
  }

  void insert(const QString& path, const Object& o)
  {
    objects.insert(path, o);
    (o.kind == EntityKind::Stream ? streamOrder : sinkOrder).push_back(path);
  }

  void erase(const QString& path)
  {
    objects.remove(path);
    streamOrder.removeAll(path);
    sinkOrder.removeAll(path);
  }

  bool reconnect(QString* error = nullptr) override
  {
    reconnects++;
    if (failReconnect) {
      return fail(error);
    }
    return true;
  }

  bool listPlaybackStreams(QStringList* paths, QString* error = nullptr) override
  {
    if (shouldFail()) {
      return fail(error);
    }
    *paths = streamOrder;
    return true;
  }

  bool listSinks(QStringList* paths, QString* error = nullptr) override
  {
    if (shouldFail()) {
      return fail(error);
    }
    *paths = sinkOrder;
    return true;
  }

  bool properties(const QString& path, EntityKind, PropertyList* out, QString* error = nullptr) override
  {
    if (shouldFail() || !objects.contains(path)) {
      return fail(error);
    }
    *out = objects.value(path).props;
    return true;
  }

  bool volume(const QString& path, EntityKind, QVector<uint32_t>* levels, QString* error = nullptr) override
  {
    volumeGets++;
    if (shouldFail() || !objects.contains(path)) {
      return fail(error);
    }
    *levels = objects.value(path).levels;
    return true;
  }

  bool setVolume(const QString& path, EntityKind, const QVector<uint32_t>& levels, QString* error = nullptr) override
  {
    volumeSets++;
    if (shouldFail() || !objects.contains(path)) {
      return fail(error);
    }
    lastSetVolume = levels;
    objects[path].levels = levels;
    return true;
  }

  bool mute(const QString& path, EntityKind, bool* muted, QString* error = nullptr) override
  {
    muteGets++;
    if (shouldFail() || !objects.contains(path)) {
      return fail(error);
    }
    *muted = objects.value(path).muted;
    return true;
  }

  bool setMute(const QString& path, EntityKind, bool muted, QString* error = nullptr) override
  {
    if (shouldFail() || !objects.contains(path)) {
      return fail(error);
    }
    objects[path].muted = muted;
    return true;
  }

  QMap<QString, Object> objects;
  QStringList streamOrder;
  QStringList sinkOrder;

  int failNext = 0;        // remote calls that fail before things work again
  bool failReconnect = false;

  int reconnects = 0;
  int volumeGets = 0;
  int volumeSets = 0;
  int muteGets = 0;
  QVector<uint32_t> lastSetVolume;

private:
  bool shouldFail()
  {
    if (failNext > 0) {
      failNext--;
      return true;
    }
    return false;
  }

  static bool fail(QString* error)
  {
    if (error) {
      *error = QStringLiteral("fake failure");
    }
    return false;
  }
};
