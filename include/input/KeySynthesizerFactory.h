#ifndef KEYSYNTHESIZERFACTORY_H
#define KEYSYNTHESIZERFACTORY_H

#include <memory>

class IKeySynthesizer;

std::unique_ptr<IKeySynthesizer> createPlatformKeySynthesizer();
bool isPlatformKeySynthesisAvailable();

#endif // KEYSYNTHESIZERFACTORY_H
