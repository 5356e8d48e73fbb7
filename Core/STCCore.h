#pragma once

#include "Common/ChangeNotifier.h"
#include "Common/Errors.h"
#include "Common/Latch.h"
#include "EngineConfig.h"
#include "Descriptor/Bencode.h"
#include "Descriptor/TaskDescriptor.h"
#include "Protocol/ProtocolEngine.h"
#include "Cache/ResumeCache.h"
#include "Queue/WaitList.h"
#include "Task/Task.h"
#include "Task/SeedPolicy.h"
#include "Task/TaskWorker.h"
#include "Engine/TaskDoneHandler.h"
#include "Engine/EngineCore.h"
