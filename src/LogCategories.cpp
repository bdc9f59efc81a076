#include "LogCategories.h"

Q_LOGGING_CATEGORY(lcApp, "rtkrelay.app")
Q_LOGGING_CATEGORY(lcEndpoint, "rtkrelay.endpoint")
Q_LOGGING_CATEGORY(lcListener, "rtkrelay.listener")
Q_LOGGING_CATEGORY(lcNmea, "rtkrelay.nmea")
Q_LOGGING_CATEGORY(lcNtrip, "rtkrelay.ntrip")
Q_LOGGING_CATEGORY(lcRelay, "rtkrelay.relay")
Q_LOGGING_CATEGORY(lcRtcm, "rtkrelay.rtcm")
Q_LOGGING_CATEGORY(lcTunnel, "rtkrelay.tunnel")
