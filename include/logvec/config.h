#ifndef LOGVEC_CONFIG_H_
#define LOGVEC_CONFIG_H_

// Project version
#define LOGVEC_VERSION_MAJOR 1
#define LOGVEC_VERSION_MINOR 0
#define LOGVEC_VERSION_PATCH 0
#define LOGVEC_VERSION "1.0.0"

#endif // LOGVEC_CONFIG_H_
