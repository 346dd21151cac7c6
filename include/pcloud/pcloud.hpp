#pragma once

#include "pcloud/builders/FileBuilders.hpp"
#include "pcloud/builders/FolderBuilders.hpp"
#include "pcloud/builders/UploadBuilder.hpp"
#include "pcloud/checksum/ChecksumPolicy.hpp"
#include "pcloud/client/Client.hpp"
#include "pcloud/errors/Errors.hpp"
#include "pcloud/types/Identifier.hpp"
#include "pcloud/types/Metadata.hpp"
#include "pcloud/types/Result.hpp"
